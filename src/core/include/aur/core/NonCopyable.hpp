/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy operations but keeps moves.
 *
 * Used by the objects that own large spectra or scratch buffers, where an
 * accidental copy would duplicate megabytes on the audio thread.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_CORE_NON_COPYABLE_HPP
    #define AUR_CORE_NON_COPYABLE_HPP

namespace aur::core {

/**
 * @brief Inherit (privately) to disable copy construction and assignment.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

} // namespace aur::core

#endif // AUR_CORE_NON_COPYABLE_HPP
