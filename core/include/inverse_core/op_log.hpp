#pragma once

#include <cassert>
#include <cstddef>

#include "inverse_core/config.hpp"
#include "inverse_core/error.hpp"
#include "inverse_core/row_ops.hpp"

namespace inverse_core {
// append only history of the row ops applied during one inversion, in order
//
// value semantics: copies (and snapshot()) are independent of the live log
class OpLog {
	  public:
		ErrorCode record(const RowOp& op) noexcept {
				if (size_ >= kMaxRowOps)
						return ErrorCode::Overflow;
				ops_[size_++] = op;
				return ErrorCode::Ok;
		}

		OpLog snapshot() const noexcept { return *this; }

		void clear() noexcept { size_ = 0; }

		std::size_t size() const noexcept { return size_; }
		bool empty() const noexcept { return size_ == 0; }

		const RowOp& operator[](std::size_t i) const noexcept {
				assert(i < size_);
				return ops_[i];
		}

		const RowOp* begin() const noexcept { return ops_; }
		const RowOp* end() const noexcept { return ops_ + size_; }

		std::size_t count(RowOpKind kind) const noexcept {
				std::size_t n = 0;
				for (const RowOp& op : *this) {
						if (op.kind() == kind)
								n++;
				}
				return n;
		}

	  private:
		RowOp ops_[kMaxRowOps]{};
		std::size_t size_ = 0;
};
} // namespace inverse_core
