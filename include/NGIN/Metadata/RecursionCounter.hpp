// RecursionCounter.hpp
// Depth guard for recursive decoding
#pragma once

#include <NGIN/Primitives.hpp>

namespace NGIN::Metadata
{

  class RecursionCounter
  {
  public:
    explicit constexpr RecursionCounter(NGIN::UInt32 limit = 100) noexcept : m_limit(limit) {}

    [[nodiscard]] constexpr NGIN::UInt32 Depth() const noexcept { return m_depth; }
    [[nodiscard]] constexpr NGIN::UInt32 Limit() const noexcept { return m_limit; }

    constexpr bool Increment() noexcept
    {
      if (m_depth >= m_limit)
        return false;
      ++m_depth;
      return true;
    }

    constexpr void Decrement() noexcept
    {
      if (m_depth > 0)
        --m_depth;
    }

  private:
    NGIN::UInt32 m_depth{0};
    NGIN::UInt32 m_limit;
  };

  // Holds one level of a RecursionCounter for the lifetime of the scope.
  // Test with operator bool: false means the limit was reached and nothing was acquired.
  class RecursionScope
  {
  public:
    explicit RecursionScope(RecursionCounter &counter) noexcept
        : m_counter(&counter), m_acquired(counter.Increment())
    {
    }
    ~RecursionScope()
    {
      if (m_acquired)
        m_counter->Decrement();
    }
    RecursionScope(const RecursionScope &) = delete;
    RecursionScope &operator=(const RecursionScope &) = delete;

    explicit operator bool() const noexcept { return m_acquired; }

  private:
    RecursionCounter *m_counter;
    bool m_acquired;
  };

} // namespace NGIN::Metadata
