#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <peek/config/viewer_config.h>
#include <peek/core/types.h>
#include <peek/session/file_session.h>

namespace peek::session {

/**
 * @brief Owns the session for whatever path the viewer currently shows
 *
 * Opening a new path cancels the previous session and waits for its background task to stop
 * before it is released, so no stale loader keeps writing after the switch.
 */
class SessionController {
public:
    explicit SessionController(config::ViewerConfig config = {});
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /**
     * @brief Replace the current session with a freshly loaded one for path
     * @return The new session, or the load error (no session is kept on failure)
     */
    Result<FileSession*> open(const std::filesystem::path& path);

    [[nodiscard]] FileSession* current() noexcept { return current_.get(); }
    [[nodiscard]] const FileSession* current() const noexcept { return current_.get(); }

    /**
     * @brief Cancel, join and release the current session
     * @return Final status of the released session, or nullopt if there was none
     */
    std::optional<LoadStatus> close();

    /**
     * @brief Final status of the session most recently released by open() or close()
     */
    [[nodiscard]] const std::optional<LoadStatus>& lastReleased() const noexcept {
        return lastReleased_;
    }

    [[nodiscard]] const config::ViewerConfig& config() const noexcept { return config_; }

private:
    config::ViewerConfig config_;
    std::unique_ptr<FileSession> current_;
    std::optional<LoadStatus> lastReleased_;
};

} // namespace peek::session
