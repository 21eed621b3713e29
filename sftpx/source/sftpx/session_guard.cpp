#include <sftpx/session_guard.hpp>

#include <utility>

namespace Sftpx
{
    std::expected<SessionGuard, Error> SessionGuard::acquire(TransferSession& session)
    {
        auto result = session.connect().get();
        if (!result)
            return std::unexpected(std::move(result).error());
        return SessionGuard{session};
    }

    SessionGuard::SessionGuard(TransferSession& session)
        : session_{&session}
    {}

    SessionGuard::~SessionGuard()
    {
        release();
    }

    SessionGuard::SessionGuard(SessionGuard&& other) noexcept
        : session_{std::exchange(other.session_, nullptr)}
    {}

    SessionGuard& SessionGuard::operator=(SessionGuard&& other) noexcept
    {
        if (this != &other)
        {
            release();
            session_ = std::exchange(other.session_, nullptr);
        }
        return *this;
    }

    void SessionGuard::release()
    {
        if (session_ == nullptr)
            return;
        std::exchange(session_, nullptr)->close().wait();
    }
}
