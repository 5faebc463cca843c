#pragma once

#include <memory>

#include "container/container_client.hpp"

namespace evalbox::container {

// Owns a ContainerClient and releases its container when the scope ends.
class ScopedContainer {
public:
    ScopedContainer() = default;
    explicit ScopedContainer(std::unique_ptr<ContainerClient> client);
    ~ScopedContainer();

    ScopedContainer(ScopedContainer&& other) noexcept;
    ScopedContainer& operator=(ScopedContainer&& other) noexcept;
    ScopedContainer(const ScopedContainer&) = delete;
    ScopedContainer& operator=(const ScopedContainer&) = delete;

    // Issues the release now; the destructor then has nothing left to do.
    void Release() noexcept;

    ContainerClient* Get() const { return client_.get(); }
    ContainerClient* operator->() const { return client_.get(); }
    ContainerClient& operator*() const { return *client_; }
    explicit operator bool() const { return static_cast<bool>(client_); }

private:
    std::unique_ptr<ContainerClient> client_;
};

// Launches a fresh container and wraps it. Throws ContainerError on launch failure.
ScopedContainer StartScopedContainer(ContainerConfig config,
                                     std::shared_ptr<utils::Logger> logger = nullptr);

}  // namespace evalbox::container
