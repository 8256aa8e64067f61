#include "ConsoleUtils.hpp"

#include "securevault/security/MemoryWiper.hpp"
#include <iostream>
#include <plog/Log.h>
#include <string>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace securevault::ui::cli
{

namespace
{

// Restores the terminal mode on scope exit, also when getline throws.
class EchoGuard final
{
public:
    EchoGuard()
    {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        m_active = GetConsoleMode(m_handle, &m_saved) != 0;
        if (m_active)
        {
            SetConsoleMode(m_handle, m_saved & ~ENABLE_ECHO_INPUT);
        }
#else
        m_active = isatty(STDIN_FILENO) != 0 && tcgetattr(STDIN_FILENO, &m_saved) == 0;
        if (m_active)
        {
            struct termios tty = m_saved;
            tty.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            (void)tcsetattr(STDIN_FILENO, TCSANOW, &tty);
        }
#endif
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    ~EchoGuard()
    {
        if (!m_active)
        {
            return;
        }
#if defined(_WIN32)
        SetConsoleMode(m_handle, m_saved);
#else
        (void)tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
#endif
    }

private:
    bool m_active{ false };
#if defined(_WIN32)
    HANDLE m_handle{};
    DWORD m_saved{};
#else
    struct termios m_saved
    {
    };
#endif
};

} // namespace

void hardenProcess() noexcept
{
#if defined(__linux__)
    if (mlockall(MCL_CURRENT | MCL_FUTURE) != 0)
    {
        PLOGW << "mlockall failed; secrets may be swapped";
    }
    struct rlimit lim
    {
        0, 0
    };
    if (setrlimit(RLIMIT_CORE, &lim) != 0)
    {
        PLOGW << "could not disable core dumps";
    }
#endif
}

securevault::security::SecureString readPassword(const std::string& prompt, std::ostream& out)
{
    out << prompt << std::flush;

    std::string line;
    {
        const EchoGuard guard{};
        std::getline(std::cin, line);
    }
    out << "\n";

    auto sec = securevault::security::secureStringFrom(line);
    securevault::security::secureWipe(std::as_writable_bytes(std::span{ line }));
    return sec;
}

} // namespace securevault::ui::cli
