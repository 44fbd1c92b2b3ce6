#pragma once

#include <cstdint>

#include "inverse_core/error.hpp"
#include "inverse_core/op_log.hpp"
#include "inverse_core/working_matrix.hpp"

namespace inverse_core::detail {
struct EliminationReport {
		bool singular = false;
		std::uint8_t singular_col = 0; // valid when singular
		double determinant = 0.0;      // 0 when singular
};

// gauss jordan with partial pivoting on [A | I], in place
//
// every applied row op is appended to log before the next one runs, so on a
// singular stop the log holds exactly the ops applied so far. returns non Ok
// only for internal failures (log overflow, bad augmented shape)
ErrorCode gauss_jordan(InOut WorkingMatrix& aug, InOut OpLog& log, Out EliminationReport* report) noexcept;
} // namespace inverse_core::detail
