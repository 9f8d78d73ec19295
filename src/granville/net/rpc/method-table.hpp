
#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace granville::net {

/**
 * @brief The method ids of one grain interface.
 *
 * A method's id is its index in the alphabetical order of the interface's
 * method names. Servers assign ids the same way, so ids are never sent
 * alongside names. Built at compile time; a duplicate name is a compile
 * error when the table is `constexpr`.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * static constexpr auto k_methods = make_method_table("Move", "GetPosition", "Attack");
 * static_assert(k_methods.id_of("Attack") == 0);
 * static_assert(k_methods.id_of("Move") == 2);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
template <std::size_t N> class MethodTable {
private:
  std::array<std::string_view, N> names_{};

public:
  constexpr explicit MethodTable(std::array<std::string_view, N> names) : names_{names} {
    std::sort(names_.begin(), names_.end());
    for (std::size_t i = 1; i < N; ++i)
      if (names_[i - 1] == names_[i])
        throw std::logic_error("duplicate method name in method table");
  }

  /** @return The method id of `name`, or -1 if the interface has no such method */
  constexpr int32_t id_of(std::string_view name) const {
    const auto ii = std::lower_bound(names_.begin(), names_.end(), name);
    return (ii != names_.end() && *ii == name) ? int32_t(ii - names_.begin()) : -1;
  }

  /** @return The name of method `id`, or an empty string for an unknown id */
  constexpr std::string_view name_of(int32_t id) const {
    return (id >= 0 && std::size_t(id) < N) ? names_[std::size_t(id)] : std::string_view{};
  }

  constexpr bool contains(std::string_view name) const { return id_of(name) >= 0; }

  static constexpr std::size_t size() { return N; }

  constexpr auto begin() const { return names_.begin(); }
  constexpr auto end() const { return names_.end(); }
};

template <typename... Names> constexpr auto make_method_table(const Names&... names) {
  return MethodTable<sizeof...(Names)>{
      std::array<std::string_view, sizeof...(Names)>{std::string_view{names}...}};
}

} // namespace granville::net
