#include "inverse_core/row_reduction.hpp"

namespace inverse_core {

ErrorCode apply_row_op(MatrixMutView m, const RowOp& op) noexcept {
		if (!m.data)
				return ErrorCode::Internal;
		if (op.target_row() >= m.rows || op.source_row() >= m.rows)
				return ErrorCode::IndexOutOfRange;

		switch (op.kind()) {
		case RowOpKind::Swap:
				apply_swap(m, op.target_row(), op.source_row());
				return ErrorCode::Ok;
		case RowOpKind::Scale:
				apply_scale(m, op.target_row(), op.factor());
				return ErrorCode::Ok;
		case RowOpKind::AddMul:
				if (op.target_row() == op.source_row())
						return ErrorCode::Internal;
				apply_addmul(m, op.target_row(), op.source_row(), op.factor());
				return ErrorCode::Ok;
		}
		__builtin_unreachable();
}

} // namespace inverse_core
