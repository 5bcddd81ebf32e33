#include <spdlog/spdlog.h>
#include <peek/session/session_controller.h>

namespace peek::session {

SessionController::SessionController(config::ViewerConfig config) : config_(std::move(config)) {}

SessionController::~SessionController() {
    close();
}

Result<FileSession*> SessionController::open(const std::filesystem::path& path) {
    close();

    auto session = std::make_unique<FileSession>(path, config_);
    auto loaded = session->load();
    if (!loaded) {
        return loaded.error();
    }

    current_ = std::move(session);
    return current_.get();
}

std::optional<LoadStatus> SessionController::close() {
    if (!current_) {
        return std::nullopt;
    }
    current_->cancel();
    current_->wait();

    auto status = current_->status();
    spdlog::debug("[SessionController] Released session for {} ({})",
                  current_->handle().absolutePath.string(), loadStateToString(status.state));
    current_.reset();
    lastReleased_ = status;
    return status;
}

} // namespace peek::session
