#include "inverse_core/error.hpp"

namespace inverse_core {

const char* error_code_name(ErrorCode code) noexcept {
		switch (code) {
		case ErrorCode::Ok:
				return "Ok";
		case ErrorCode::InvalidDimension:
				return "InvalidDimension";
		case ErrorCode::InvalidValue:
				return "InvalidValue";
		case ErrorCode::DimensionMismatch:
				return "DimensionMismatch";
		case ErrorCode::IndexOutOfRange:
				return "IndexOutOfRange";
		case ErrorCode::StepOutOfRange:
				return "StepOutOfRange";
		case ErrorCode::BufferTooSmall:
				return "BufferTooSmall";
		case ErrorCode::Overflow:
				return "Overflow";
		case ErrorCode::Internal:
				return "Internal";
		}
		return "Unknown";
}

} // namespace inverse_core
