#pragma once

#include <type_traits>

namespace labmarker {

/**
 * \brief A trivially-movable, but non-copyable type.
 *
 * Use as a superclass to annotate a subclass as non-copyable.
 */
class NonCopyable
{
public:
    NonCopyable() = default;

    NonCopyable& operator=(const NonCopyable&) = delete;
    NonCopyable(const NonCopyable&) = delete;

    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator=(NonCopyable&&) = default;

    ~NonCopyable() = default;
};

static_assert(!std::is_copy_constructible_v<NonCopyable> && std::is_trivially_move_constructible_v<NonCopyable>,
              "NonCopyable should be movable, not copyable");

/**
 * \brief A non-movable and non-copyable type.
 */
class NonMovable : public NonCopyable
{
public:
    NonMovable() = default;

    NonMovable(const NonMovable&) = delete;
    NonMovable& operator=(const NonMovable&) = delete;

    NonMovable(NonMovable&&) = delete;
    NonMovable& operator=(NonMovable&&) = delete;

    ~NonMovable() = default;
};

static_assert(!std::is_copy_constructible_v<NonMovable> && !std::is_move_constructible_v<NonMovable>,
              "NonMovable should be neither copyable nor movable");

} // namespace labmarker
