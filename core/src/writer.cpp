#include "inverse_core/writer.hpp"

namespace inverse_core {

ErrorCode format_number(double v, Buffer out) noexcept {
		Writer w{out.data, out.cap, 0};
		if (w.data && w.cap)
				w.data[0] = '\0';
		return w.append_number(v);
}

} // namespace inverse_core
