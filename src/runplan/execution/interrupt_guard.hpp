/**
 * @file interrupt_guard.hpp
 * @brief Scoped SIGINT handler that raises an executor's stop flag.
 */
#pragma once
#include "runplan/common/common.hpp"

#include <signal.h>

namespace runplan
{

/**
 * @brief Routes SIGINT to a stop flag for as long as the guard lives.
 *
 * @details
 * The handler is installed without `SA_RESTART`, so a console read blocked
 * at the time of the signal fails and the running step can report the
 * interrupt. The destructor reinstates the previous disposition before the
 * flag is released, so a late signal never touches a destroyed flag.
 *
 * Only one guard may be active at a time.
 */
class InterruptGuard
{
public:
    explicit InterruptGuard(std::atomic<bool>& flag);
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    struct sigaction m_previous{};
};

} // namespace runplan
