#pragma once

#include <cstddef>
#include <cstdint>

#include "inverse_core/error.hpp"
#include "inverse_core/matrix.hpp"
#include "inverse_core/op_log.hpp"
#include "inverse_core/working_matrix.hpp"

namespace inverse_core {
enum class InversionOutcome : std::uint8_t {
		None,     // not computed, op_inverse rejected the input
		Inverted,
		Singular,
};

struct InversionResult {
		InversionOutcome outcome = InversionOutcome::None;
		Matrix inverse{}; // valid when Inverted
		OpLog log{};      // full log, or the ops applied before the singular pivot
		double determinant = 0.0;
		std::uint8_t singular_col = 0; // 0 based pivot column, valid when Singular

		bool inverted() const noexcept { return outcome == InversionOutcome::Inverted; }
		bool singular() const noexcept { return outcome == InversionOutcome::Singular; }
};

// indices in these APIs are 0 based (consistent with m.at(r, c))
// the shell can present 1 based indices and convert as needed

// inverse via gauss jordan elimination on the augmented matrix [A | I]
//
// a non Ok Error means the input was rejected (InvalidDimension, InvalidValue)
// and *out is reset with an empty log. a singular matrix is not an error: the
// call succeeds with out->outcome == Singular
Error op_inverse(In MatrixView a, Out InversionResult* out) noexcept;

// rebuilds [A | I] and applies the first count ops of log to it
Error replay_log(In MatrixView a, In const OpLog& log, In std::size_t count, Out WorkingMatrix* out) noexcept;

struct StepRenderBuffers {
		char* caption = nullptr;
		std::size_t caption_cap = 0;
		char* latex = nullptr;
		std::size_t latex_cap = 0;
};

// step 0 is the initial [A | I], step k is the augmented matrix after log[k - 1]
// with that op's caption
std::size_t inverse_step_count(In const OpLog& log) noexcept;
ErrorCode render_inverse_step(In MatrixView a, In const OpLog& log, In std::size_t index, In const StepRenderBuffers& out) noexcept;

} // namespace inverse_core
