// modelspec/ast/ast_context.hpp - Arena that owns the nodes of one parse
//
// Nodes, node lists and interned names all come from one monotonic PMR
// buffer and are released together when the context is destroyed. Pointers
// and views handed out stay valid until then.
//
#pragma once

#include <algorithm>
#include <cstddef>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace modelspec
{

class AstNode;

class AstContext
{
public:
  /// A typical model of a dozen terms fits in the first block.
  static constexpr size_t k_initial_block = 4096;

  explicit AstContext(size_t initial_block = k_initial_block)
  : arena_(initial_block), names_(&arena_)
  {
  }

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>);
    // The arena never runs destructors.
    static_assert(std::is_trivially_destructible_v<T>, "node members must be views or spans");
    return new (arena_.allocate(sizeof(T), alignof(T))) T(std::forward<Args>(args)...);
  }

  /// Copy `text` into the arena once; later calls with equal text share it.
  [[nodiscard]] std::string_view intern(std::string_view text)
  {
    if (const auto found = names_.find(text); found != names_.end()) {
      return *found;
    }
    auto * storage = static_cast<char *>(arena_.allocate(std::max<size_t>(text.size(), 1), 1));
    std::copy(text.begin(), text.end(), storage);
    return *names_.emplace(storage, text.size()).first;
  }

  [[nodiscard]] size_t interned_count() const noexcept { return names_.size(); }

  /// Arena-backed copy of a list collected while parsing.
  template <typename T>
  [[nodiscard]] gsl::span<T> to_span(const std::vector<T> & items)
  {
    if (items.empty()) return {};
    auto * storage = static_cast<T *>(arena_.allocate(items.size() * sizeof(T), alignof(T)));
    std::uninitialized_copy(items.begin(), items.end(), storage);
    return gsl::span<T>(storage, items.size());
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> names_;
};

}  // namespace modelspec
