#pragma once

namespace acpbridge::protocol::methods {

    constexpr const char* kProtocolVersion = "2024-01";

    // Orchestrator -> agent
    constexpr const char* kInitialize = "initialize";
    constexpr const char* kSessionNew = "session/new";
    constexpr const char* kSessionPrompt = "session/prompt";
    constexpr const char* kSessionCancel = "session/cancel";

    // Agent -> orchestrator
    constexpr const char* kSessionUpdate = "session/update";
    constexpr const char* kRequestPermission = "session/request_permission";
    constexpr const char* kReadTextFile = "fs/read_text_file";
    constexpr const char* kWriteTextFile = "fs/write_text_file";
    constexpr const char* kTerminalCreate = "terminal/create";
    constexpr const char* kTerminalOutput = "terminal/output";
    constexpr const char* kTerminalWaitForExit = "terminal/wait_for_exit";
    constexpr const char* kTerminalKill = "terminal/kill";
    constexpr const char* kTerminalRelease = "terminal/release";

} // namespace acpbridge::protocol::methods
