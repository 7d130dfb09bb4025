#include <pve_session/http/refresh_coordinator.hpp>
#include <pve_session/core/log.hpp>

namespace pve_session {

Result<void, Error> RefreshCoordinator::Refresh(uint64_t observed_generation) {
    std::shared_ptr<Flight> flight;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (store_.Generation() > observed_generation) {
            LogDebug("auth", "Session already refreshed by another caller");
            return Result<void, Error>::Ok();
        }
        if (in_flight_) {
            flight = in_flight_;
            LogDebug("auth", "Waiting for in-flight login");
            cv_.wait(lock, [&flight] { return flight->done; });
            if (flight->error.has_value()) {
                return Result<void, Error>::Err(*flight->error);
            }
            return Result<void, Error>::Ok();
        }
        flight = std::make_shared<Flight>();
        in_flight_ = flight;
        ++login_count_;
    }

    LogInfo("auth", "Refreshing ticket for " + descriptor_.UserId());
    auto state = login_.Execute(descriptor_);

    std::optional<Error> error;
    if (state.IsOk()) {
        store_.Write(std::move(state).Value());
    } else {
        error = std::move(state).Error();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        flight->done = true;
        flight->error = error;
        in_flight_.reset();
    }
    cv_.notify_all();

    if (error.has_value()) {
        return Result<void, Error>::Err(std::move(*error));
    }
    return Result<void, Error>::Ok();
}

uint64_t RefreshCoordinator::LoginCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return login_count_;
}

} // namespace pve_session
