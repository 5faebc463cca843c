#include "container/scoped_container.hpp"

#include <utility>

namespace evalbox::container {

ScopedContainer::ScopedContainer(std::unique_ptr<ContainerClient> client)
    : client_(std::move(client)) {}

ScopedContainer::~ScopedContainer() {
    Release();
}

ScopedContainer::ScopedContainer(ScopedContainer&& other) noexcept
    : client_(std::move(other.client_)) {}

ScopedContainer& ScopedContainer::operator=(ScopedContainer&& other) noexcept {
    if (this != &other) {
        Release();
        client_ = std::move(other.client_);
    }
    return *this;
}

void ScopedContainer::Release() noexcept {
    if (client_) {
        client_->Cleanup();
    }
}

ScopedContainer StartScopedContainer(ContainerConfig config, std::shared_ptr<utils::Logger> logger) {
    auto client = std::make_unique<ContainerClient>(std::move(config), std::move(logger));
    // Owned before launch so a partially started container is still released.
    ScopedContainer scoped(std::move(client));
    scoped->StartContainer();
    return scoped;
}

}  // namespace evalbox::container
