#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "sandbox/execution_backend.hpp"

namespace codebox::testing {

// Backend whose behaviour is a callback; records every request it sees.
class FakeBackend : public codebox::sandbox::ExecutionBackend {
public:
    using Handler = std::function<codebox::sandbox::ExecResponse(const codebox::sandbox::ExecRequest&)>;

    explicit FakeBackend(Handler handler) : handler_(std::move(handler)) {}

    static std::shared_ptr<FakeBackend> Returning(std::string stdout_text,
                                                  std::string stderr_text,
                                                  int exit_status) {
        return std::make_shared<FakeBackend>(
            [=](const codebox::sandbox::ExecRequest&) {
                codebox::sandbox::ExecResponse response{};
                response.stdout_text = stdout_text;
                response.stderr_text = stderr_text;
                response.exit_status = exit_status;
                return response;
            });
    }

    codebox::sandbox::ExecResponse Exec(const codebox::sandbox::ExecRequest& request) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        return handler_(request);
    }

    std::string Name() const override { return "fake"; }

    std::vector<codebox::sandbox::ExecRequest> Requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    Handler handler_;
    mutable std::mutex mutex_;
    std::vector<codebox::sandbox::ExecRequest> requests_;
};

}  // namespace codebox::testing
