#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "environment_fwd.hpp"
#include "object.hpp"

struct environment final
{
    explicit environment(environment_ptr parent_env = {});
    environment(const environment&) = delete;
    environment(environment&&) = delete;
    auto operator=(const environment&) -> environment& = delete;
    auto operator=(environment&&) -> environment& = delete;
    ~environment() = default;

    // walks the chain innermost first, an empty result means unbound
    [[nodiscard]] auto find(std::string_view name) const -> std::optional<object>;
    [[nodiscard]] auto get(std::string_view name) const -> object;
    auto set(std::string_view name, object val) -> void;

    // Clears this frame and every frame registered with the root of its chain. Closures bound in
    // a frame hold the frame they capture, so this is the teardown for a whole session.
    auto break_cycle() -> void;

    std::unordered_map<std::string, object> store;
    environment_ptr parent;

  private:
    static constexpr std::size_t min_prune_size = 64;

    friend auto make_frame(const environment_ptr& parent_env) -> environment_ptr;

    auto root() -> environment&;
    auto track(const environment_ptr& frame) -> void;

    std::vector<std::weak_ptr<environment>> m_frames;
    std::size_t m_prune_at {min_prune_size};
};

// a child of `parent_env` whose bindings are released when its chain is torn down
auto make_frame(const environment_ptr& parent_env) -> environment_ptr;
