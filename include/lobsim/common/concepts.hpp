#pragma once
/**
 * @file concepts.hpp
 * @brief Constraints on logger arguments and book callbacks
 */

#include <concepts>
#include <type_traits>

namespace lobsim {

/// Copied by value into a log slot and formatted on the writer thread
template<typename T>
concept LogArgument = std::is_arithmetic_v<std::remove_cvref_t<T>> ||
                      std::is_pointer_v<std::remove_cvref_t<T>>;

/// Receives each Trade a book mutation prints
template<typename F, typename Trade>
concept TradeHandler = std::invocable<F, const Trade&>;

/// Receives both sides' Fill records of each trade
template<typename F, typename Fill>
concept FillHandler = std::invocable<F, const Fill&>;

} // namespace lobsim
