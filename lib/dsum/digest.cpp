#include "digest.hpp"

#include <digestpp.hpp>

using namespace dsum;

struct Digest::Impl {
    digestpp::sha256 hasher;
};

Digest::Digest() : impl_(std::make_unique<Impl>()) {}

Digest::Digest(Digest&&) noexcept = default;

Digest& Digest::operator=(Digest&&) noexcept = default;

Digest::~Digest() noexcept = default;

auto Digest::update(std::span<char const> data) -> void {
    if (data.empty()) {
        return;
    }
    impl_->hasher.absorb((std::uint8_t const*)data.data(), data.size());
    size_ += data.size();
}

auto Digest::reset() -> void {
    impl_->hasher.reset();
    size_ = 0;
}

// hexdigest() finalizes a copy so the running state can keep absorbing.
auto Digest::hexdigest() const -> std::string {
    auto copy = impl_->hasher;
    return copy.hexdigest();
}

auto Digest::of(std::span<char const> data) -> std::string {
    auto digest = Digest{};
    digest.update(data);
    return digest.hexdigest();
}
