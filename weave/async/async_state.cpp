#include "async_state.hpp"

namespace weave::async {

auto toString(AsyncStatus status) noexcept -> std::string_view {
    switch (status) {
        case AsyncStatus::Idle:
            return "idle";
        case AsyncStatus::Loading:
            return "loading";
        case AsyncStatus::Success:
            return "success";
        case AsyncStatus::Error:
            return "error";
    }
    return "unknown";
}

}  // namespace weave::async
