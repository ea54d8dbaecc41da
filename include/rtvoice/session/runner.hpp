#pragma once

#include <memory>

#include <rtvoice/session/controller.hpp>
#include <rtvoice/session/options.hpp>

namespace rtvoice::session {

SessionOptions makeSessionOptions(const ClientOptions& options);

// Drives one session on a libuv loop: connect on a worker thread, then stay
// connected for the configured duration. SIGINT/SIGTERM cancel a pending
// connect or end the session early.
//
// Exit codes: 0 when the duration elapsed or the user interrupted,
// 1 when connect failed or the connection was lost.
class ClientRunner {
public:
    ClientRunner(ClientOptions options, SessionDependencies dependencies);
    ~ClientRunner();

    ClientRunner(const ClientRunner&) = delete;
    ClientRunner& operator=(const ClientRunner&) = delete;

    int run();

    // Same as an interrupt. Safe from any thread while run() is active.
    void requestStop();

    SessionController& controller();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rtvoice::session
