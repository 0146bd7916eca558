/**
 * @file interrupt_guard.cpp
 */
#include "runplan/execution/interrupt_guard.hpp"

#include <cerrno>
#include <cstring>

namespace runplan
{

namespace
{

std::atomic<std::atomic<bool>*> g_stop_flag{nullptr};

extern "C" void on_interrupt(int)
{
    std::atomic<bool>* flag = g_stop_flag.load();
    if (flag != nullptr)
    {
        flag->store(true);
    }
}

} // namespace

InterruptGuard::InterruptGuard(std::atomic<bool>& flag)
{
    g_stop_flag.store(&flag);

    struct sigaction action{};
    action.sa_handler = on_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (sigaction(SIGINT, &action, &m_previous) != 0)
    {
        g_stop_flag.store(nullptr);
        throw std::runtime_error(
            std::string("Cannot install the SIGINT handler: ") + std::strerror(errno));
    }
}

InterruptGuard::~InterruptGuard()
{
    sigaction(SIGINT, &m_previous, nullptr);
    g_stop_flag.store(nullptr);
}

} // namespace runplan
