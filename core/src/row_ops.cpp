#include "inverse_core/row_ops.hpp"

#include "inverse_core/writer.hpp"

namespace inverse_core {
namespace {

// U+2080..U+2089
ErrorCode append_subscript_index1(Writer& w, std::uint8_t row) noexcept {
		char digits[8];
		Writer dw{digits, sizeof(digits), 0};
		ErrorCode ec = dw.append_index1(row);
		if (!is_ok(ec))
				return ec;
		for (std::size_t i = 0; i < dw.len; i++) {
				ec = w.put(static_cast<char>(0xE2));
				if (!is_ok(ec))
						return ec;
				ec = w.put(static_cast<char>(0x82));
				if (!is_ok(ec))
						return ec;
				ec = w.put(static_cast<char>(0x80 + (digits[i] - '0')));
				if (!is_ok(ec))
						return ec;
		}
		return ErrorCode::Ok;
}

} // namespace

RowOp::RowOp(RowOpKind kind, std::uint8_t target, std::uint8_t source, double factor) noexcept
        : kind_(kind), target_(target), source_(source), factor_(factor) {
		// kDescriptionCap covers the longest row/factor text, overflow is a bug
		CheckedWriter w{description_, sizeof(description_)};
		w.put('R');
		w.append_index1(target_);
		switch (kind_) {
		case RowOpKind::Swap:
				w.append(" <-> R");
				w.append_index1(source_);
				break;
		case RowOpKind::Scale:
				w.append(" <- (");
				w.append_number(factor_);
				w.append(") R");
				w.append_index1(target_);
				break;
		case RowOpKind::AddMul:
				w.append(" <- R");
				w.append_index1(target_);
				w.append(" + (");
				w.append_number(factor_);
				w.append(") R");
				w.append_index1(source_);
				break;
		}
}

RowOp RowOp::swap(std::uint8_t r1, std::uint8_t r2) noexcept {
		return RowOp(RowOpKind::Swap, r1, r2, 0.0);
}

RowOp RowOp::scale(std::uint8_t row, double k) noexcept {
		return RowOp(RowOpKind::Scale, row, row, k);
}

RowOp RowOp::add_multiple(std::uint8_t target, std::uint8_t source, double k) noexcept {
		return RowOp(RowOpKind::AddMul, target, source, k);
}

std::uint8_t row_op_type(const RowOp& op) noexcept {
		switch (op.kind()) {
		case RowOpKind::Swap:
				return 1;
		case RowOpKind::Scale:
				return 2;
		case RowOpKind::AddMul:
				return 3;
		}
		__builtin_unreachable();
}

ErrorCode row_op_caption(const RowOp& op, char* out, std::size_t cap) noexcept {
		if (!out || cap == 0)
				return ErrorCode::BufferTooSmall;
		out[0] = '\0';

		Writer w{out, cap, 0};

		switch (op.kind()) {
		case RowOpKind::Swap: {
				ErrorCode ec = w.append("$R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.target_row());
				if (!is_ok(ec))
						return ec;
				ec = w.append("} \\leftrightarrow R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.source_row());
				if (!is_ok(ec))
						return ec;
				return w.append("}$");
		}
		case RowOpKind::Scale: {
				ErrorCode ec = w.append("$R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.target_row());
				if (!is_ok(ec))
						return ec;
				ec = w.append("} \\leftarrow (");
				if (!is_ok(ec))
						return ec;
				ec = w.append_number(op.factor());
				if (!is_ok(ec))
						return ec;
				ec = w.append(") R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.target_row());
				if (!is_ok(ec))
						return ec;
				return w.append("}$");
		}
		case RowOpKind::AddMul: {
				ErrorCode ec = w.append("$R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.target_row());
				if (!is_ok(ec))
						return ec;
				ec = w.append("} \\leftarrow R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.target_row());
				if (!is_ok(ec))
						return ec;
				ec = w.append("} + (");
				if (!is_ok(ec))
						return ec;
				ec = w.append_number(op.factor());
				if (!is_ok(ec))
						return ec;
				ec = w.append(") R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.source_row());
				if (!is_ok(ec))
						return ec;
				return w.append("}$");
		}
		}
		__builtin_unreachable();
}

ErrorCode row_op_elementary(const RowOp& op, char* out, std::size_t cap) noexcept {
		if (!out || cap == 0)
				return ErrorCode::BufferTooSmall;
		out[0] = '\0';

		Writer w{out, cap, 0};
		ErrorCode ec = w.put('E');
		if (!is_ok(ec))
				return ec;
		ec = append_subscript_index1(w, op.target_row());
		if (!is_ok(ec))
				return ec;

		if (op.kind() != RowOpKind::Scale) {
				ec = w.put(',');
				if (!is_ok(ec))
						return ec;
				ec = append_subscript_index1(w, op.source_row());
				if (!is_ok(ec))
						return ec;
		}
		if (op.kind() == RowOpKind::Swap)
				return ErrorCode::Ok;

		ec = w.put('(');
		if (!is_ok(ec))
				return ec;
		ec = w.append_number(op.factor());
		if (!is_ok(ec))
				return ec;
		return w.put(')');
}

} // namespace inverse_core
