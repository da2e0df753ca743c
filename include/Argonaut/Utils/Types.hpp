/**
 * @file Types.hpp
 * @brief Defines various type aliases for commonly used types.
 *
 * This header provides a collection of type aliases for commonly used types
 * in the Argonaut project. These aliases are defined using the standard library
 * types and are provided as convenient shorthand notations.
 */

#pragma once

#include <array>       // std::array (Array)
#include <cstdint>     // std::{int32_t, uint8_t, ...}
#include <functional>  // std::function (Function)
#include <memory>      // std::unique_ptr (UniquePointer)
#include <mutex>       // std::mutex and std::lock_guard (Mutex, LockGuard)
#include <optional>    // std::optional (Option)
#include <string>      // std::string (String)
#include <string_view> // std::string_view (StringView)
#include <utility>     // std::pair (Pair)
#include <variant>     // std::monostate (Empty)
#include <vector>      // std::vector (Vec)

#include "Definitions.hpp"

namespace argonaut::utils::types {
  /**
   * @brief Alias for std::uint8_t.
   *
   * 8-bit unsigned integer.
   */
  using u8 = std::uint8_t;

  /**
   * @brief Alias for std::int32_t.
   *
   * 32-bit signed integer.
   */
  using i32 = std::int32_t;

  /**
   * @brief Alias for double.
   *
   * 64-bit floating-point number.
   */
  using f64 = double;

  /**
   * @brief Alias for std::size_t.
   *
   * Unsigned size type (result of sizeof).
   */
  using usize = std::size_t;

  /**
   * @brief Alias for std::string.
   *
   * Owning, mutable string.
   */
  using String = std::string;

  /**
   * @brief Alias for std::string_view.
   *
   * Non-owning view of a string.
   */
  using StringView = std::string_view;

  /**
   * @brief Alias for const char*.
   *
   * Pointer to a null-terminated C-style string.
   */
  using PCStr = const char*;

  /**
   * @brief Alias for std::exception.
   *
   * Standard exception type.
   */
  using Exception = std::exception;

  /**
   * @brief Alias for void, used as the return type of functions without a result.
   */
  using Unit = void;

  /**
   * @brief Payload type for arguments that never carry a value (help, version).
   */
  using Empty = std::monostate;

  /**
   * @brief Alias for std::mutex.
   *
   * Mutex type for synchronization.
   */
  using Mutex = std::mutex;

  /**
   * @brief Alias for std::lock_guard<Mutex>.
   *
   * RAII-style lock guard for mutexes.
   */
  using LockGuard = std::lock_guard<Mutex>;

  /**
   * @brief Alias for std::nullopt_t.
   *
   * Represents an empty optional value.
   */
  inline constexpr std::nullopt_t None = std::nullopt;

  /**
   * @brief Alias for std::optional<Tp>.
   *
   * Represents a value that may or may not be present.
   * @tparam Tp The type of the potential value.
   */
  template <typename Tp>
  using Option = std::optional<Tp>;

  /**
   * @brief Alias for std::array<Tp, sz>.
   *
   * Represents a fixed-size array.
   * @tparam Tp The element type.
   * @tparam sz The size of the array.
   */
  template <typename Tp, usize sz>
  using Array = std::array<Tp, sz>;

  /**
   * @brief Alias for std::vector<Tp>.
   *
   * Represents a dynamic-size array (vector).
   * @tparam Tp The element type.
   */
  template <typename Tp>
  using Vec = std::vector<Tp>;

  /**
   * @brief Alias for std::pair<T1, T2>.
   *
   * Represents a pair of values.
   * @tparam T1 The type of the first element.
   * @tparam T2 The type of the second element.
   */
  template <typename T1, typename T2>
  using Pair = std::pair<T1, T2>;

  /**
   * @brief Alias for std::unique_ptr<Tp, Dp>.
   *
   * Manages unique ownership of a dynamically allocated object.
   * @tparam Tp The type of the managed object.
   * @tparam Dp The deleter type (defaults to std::default_delete<Tp>).
   */
  template <typename Tp, typename Dp = std::default_delete<Tp>>
  using UniquePointer = std::unique_ptr<Tp, Dp>;

  /**
   * @brief Alias for std::function<Sig>.
   *
   * Type-erased callable.
   * @tparam Sig The call signature.
   */
  template <typename Sig>
  using Function = std::function<Sig>;

  /**
   * @class NonEmpty
   * @brief An ordered sequence that always holds at least one element.
   *
   * Used wherever an empty list would be meaningless, e.g. the long names of
   * an argument or the collected error list of a failed parse.
   * @tparam Tp The element type.
   */
  template <typename Tp>
  class NonEmpty {
   public:
    using value_type     = Tp;
    using const_iterator = typename Vec<Tp>::const_iterator;

    explicit NonEmpty(Tp head)
      : m_items { std::move(head) } {}

    NonEmpty(Tp head, Vec<Tp> tail) {
      m_items.reserve(tail.size() + 1);
      m_items.push_back(std::move(head));
      for (Tp& item : tail)
        m_items.push_back(std::move(item));
    }

    static fn Singleton(Tp head) -> NonEmpty {
      return NonEmpty(std::move(head));
    }

    /**
     * @brief Builds a NonEmpty from a vector.
     * @return None if the vector is empty.
     */
    static fn FromVec(Vec<Tp> items) -> Option<NonEmpty> {
      if (items.empty())
        return None;

      return NonEmpty(std::move(items), 0);
    }

    [[nodiscard]] fn head() const -> const Tp& {
      return m_items.front();
    }

    [[nodiscard]] fn size() const -> usize {
      return m_items.size();
    }

    [[nodiscard]] fn operator[](const usize index) const -> const Tp& {
      return m_items[index];
    }

    [[nodiscard]] fn begin() const -> const_iterator {
      return m_items.begin();
    }

    [[nodiscard]] fn end() const -> const_iterator {
      return m_items.end();
    }

    fn push(Tp item) -> Unit {
      m_items.push_back(std::move(item));
    }

    fn extend(Vec<Tp> items) -> Unit {
      for (Tp& item : items)
        m_items.push_back(std::move(item));
    }

    fn extend(NonEmpty other) -> Unit {
      extend(std::move(other.m_items));
    }

    [[nodiscard]] fn toVec() const& -> Vec<Tp> {
      return m_items;
    }

    [[nodiscard]] fn toVec() && -> Vec<Tp> {
      return std::move(m_items);
    }

    /**
     * @brief Applies a function to every element, keeping the order.
     */
    template <typename Func>
    [[nodiscard]] fn map(Func&& func) const -> NonEmpty<std::decay_t<std::invoke_result_t<Func&, const Tp&>>> {
      using Out = std::decay_t<std::invoke_result_t<Func&, const Tp&>>;

      Vec<Out> mapped;
      mapped.reserve(m_items.size());
      for (const Tp& item : m_items)
        mapped.push_back(func(item));

      return *NonEmpty<Out>::FromVec(std::move(mapped));
    }

    fn operator==(const NonEmpty& other) const -> bool = default;

   private:
    Vec<Tp> m_items; ///< Never empty.

    NonEmpty(Vec<Tp> items, int /*tag*/)
      : m_items(std::move(items)) {}
  };
} // namespace argonaut::utils::types
