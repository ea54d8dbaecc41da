#include <rtvoice/session/runner.hpp>
#include <rtvoice/core/logger.hpp>

#include <atomic>
#include <csignal>
#include <mutex>
#include <optional>
#include <thread>

#include <uv.h>

namespace rtvoice::session {

SessionOptions makeSessionOptions(const ClientOptions& options) {
    SessionOptions session;
    session.credentials = {options.client_id, options.client_secret};
    session.server_url = options.server_url;
    session.device = options.device;
    session.ice_wait.timeout = options.ice_timeout;
    session.transcription_model = options.transcription_model;
    return session;
}

struct ClientRunner::Impl {
    ClientOptions options;
    SessionController controller;

    uv_loop_t loop{};
    uv_signal_t sigint{};
    uv_signal_t sigterm{};
    uv_timer_t duration_timer{};
    uv_async_t connect_done{};
    uv_async_t stop_request{};

    std::thread connect_thread;

    std::mutex mutex;
    bool running = false;
    bool handles_closed = false;
    std::optional<std::string> connect_error;
    std::string connect_hint;

    std::atomic<bool> connected{false};
    std::atomic<bool> interrupted{false};
    std::atomic<bool> connection_lost{false};
    int exit_code = 0;

    Impl(ClientOptions opts, SessionDependencies deps)
        : options(std::move(opts)),
          controller(std::move(deps), makeSessionOptions(options)) {}

    void startConnect();
    void shutdown();
    void interrupt(const char* reason);

    static Impl* from(uv_handle_t* handle) {
        return static_cast<Impl*>(handle->data);
    }
};

void ClientRunner::Impl::startConnect() {
    connect_thread = std::thread([this]() {
        try {
            controller.connect();
        }
        catch (const signaling::SignalingError& e) {
            std::lock_guard<std::mutex> lock(mutex);
            connect_error = e.what();
            connect_hint = e.hint();
        }
        catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex);
            connect_error = e.what();
        }

        std::lock_guard<std::mutex> lock(mutex);
        if (!handles_closed) {
            uv_async_send(&connect_done);
        }
    });
}

void ClientRunner::Impl::interrupt(const char* reason) {
    if (interrupted.exchange(true)) {
        return;
    }
    core::Logger::info("{}", reason);
    controller.cancel();
    if (connected) {
        shutdown();
    }
    // Masih connecting: connect() akan gagal dengan Cancelled dan connect_done menutup loop
}

void ClientRunner::Impl::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (handles_closed) {
            return;
        }
        handles_closed = true;
    }

    uv_timer_stop(&duration_timer);
    uv_signal_stop(&sigint);
    uv_signal_stop(&sigterm);

    uv_close(reinterpret_cast<uv_handle_t*>(&duration_timer), nullptr);
    uv_close(reinterpret_cast<uv_handle_t*>(&sigint), nullptr);
    uv_close(reinterpret_cast<uv_handle_t*>(&sigterm), nullptr);
    uv_close(reinterpret_cast<uv_handle_t*>(&connect_done), nullptr);
    uv_close(reinterpret_cast<uv_handle_t*>(&stop_request), nullptr);
}

ClientRunner::ClientRunner(ClientOptions options, SessionDependencies dependencies)
    : impl_(std::make_unique<Impl>(std::move(options), std::move(dependencies))) {}

ClientRunner::~ClientRunner() {
    if (impl_->connect_thread.joinable()) {
        impl_->controller.cancel();
        impl_->connect_thread.join();
    }
}

SessionController& ClientRunner::controller() {
    return impl_->controller;
}

void ClientRunner::requestStop() {
    Impl* impl = impl_.get();
    impl->interrupted = true;
    impl->controller.cancel();

    std::lock_guard<std::mutex> lock(impl->mutex);
    if (impl->running && !impl->handles_closed) {
        uv_async_send(&impl->stop_request);
    }
}

int ClientRunner::run() {
    Impl* impl = impl_.get();

    int result = uv_loop_init(&impl->loop);
    if (result != 0) {
        core::throw_error(core::ErrorCode::Unknown,
                          std::string("Failed to initialise event loop: ") + uv_strerror(result));
    }

    uv_signal_init(&impl->loop, &impl->sigint);
    uv_signal_init(&impl->loop, &impl->sigterm);
    uv_timer_init(&impl->loop, &impl->duration_timer);

    uv_async_init(&impl->loop, &impl->connect_done, [](uv_async_t* handle) {
        auto* self = Impl::from(reinterpret_cast<uv_handle_t*>(handle));

        std::optional<std::string> error;
        std::string hint;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            error = self->connect_error;
            hint = self->connect_hint;
        }

        if (error) {
            if (self->interrupted) {
                core::Logger::info("Connection attempt cancelled");
            } else {
                core::Logger::error("Error: {}", *error);
                if (!hint.empty()) {
                    core::Logger::error("Hint: {}", hint);
                }
                self->exit_code = 1;
            }
            self->shutdown();
            return;
        }

        self->connected = true;
        if (self->interrupted) {
            self->shutdown();
            return;
        }

        core::Logger::info("Connected! Listening for {} seconds...", self->options.duration_seconds);
        core::Logger::info("Speak into your microphone to interact with the assistant.");

        uv_timer_start(&self->duration_timer, [](uv_timer_t* timer) {
            auto* self = Impl::from(reinterpret_cast<uv_handle_t*>(timer));
            core::Logger::info("Session duration elapsed");
            self->shutdown();
        }, static_cast<uint64_t>(self->options.duration_seconds) * 1000, 0);
    });

    uv_async_init(&impl->loop, &impl->stop_request, [](uv_async_t* handle) {
        auto* self = Impl::from(reinterpret_cast<uv_handle_t*>(handle));
        if (self->connection_lost && !self->interrupted) {
            core::Logger::error("Connection to the server was lost");
            self->exit_code = 1;
            self->shutdown();
            return;
        }
        if (self->connected) {
            self->shutdown();
        }
    });

    impl->sigint.data = impl;
    impl->sigterm.data = impl;
    impl->duration_timer.data = impl;
    impl->connect_done.data = impl;
    impl->stop_request.data = impl;

    uv_signal_start(&impl->sigint, [](uv_signal_t* handle, int) {
        Impl::from(reinterpret_cast<uv_handle_t*>(handle))->interrupt("Interrupted by user");
    }, SIGINT);
    uv_signal_start(&impl->sigterm, [](uv_signal_t* handle, int) {
        Impl::from(reinterpret_cast<uv_handle_t*>(handle))->interrupt("Terminated");
    }, SIGTERM);

    auto listener = impl->controller.onConnectionStateChange.connect([impl](webrtc::PeerConnectionState state) {
        if (!impl->connected) {
            return;
        }
        if (state == webrtc::PeerConnectionState::Failed || state == webrtc::PeerConnectionState::Closed) {
            impl->connection_lost = true;
            std::lock_guard<std::mutex> lock(impl->mutex);
            if (!impl->handles_closed) {
                uv_async_send(&impl->stop_request);
            }
        }
    });

    {
        std::lock_guard<std::mutex> lock(impl->mutex);
        impl->running = true;
    }

    impl->startConnect();
    uv_run(&impl->loop, UV_RUN_DEFAULT);

    {
        std::lock_guard<std::mutex> lock(impl->mutex);
        impl->running = false;
    }

    if (impl->connect_thread.joinable()) {
        impl->connect_thread.join();
    }
    impl->controller.onConnectionStateChange.disconnect(listener);

    try {
        impl->controller.disconnect();
    }
    catch (const std::exception& e) {
        core::Logger::warn("Error during disconnect: {}", e.what());
    }

    result = uv_loop_close(&impl->loop);
    if (result != 0) {
        core::Logger::warn("Event loop closed with pending handles: {}", uv_strerror(result));
    }

    return impl->exit_code;
}

} // namespace rtvoice::session
