#pragma once

#include <sftpx/error.hpp>
#include <sftpx/transfer_session.hpp>

#include <expected>

namespace Sftpx
{
    /**
     * @brief Keeps a session connected for the lifetime of the guard and closes it afterwards,
     * also when the scope is left by an exception.
     */
    class SessionGuard
    {
      public:
        /**
         * @brief Connects the session and waits for the result.
         *
         * @return std::expected<SessionGuard, Error> The guard, or the connect error. No guard means nothing to close.
         */
        static std::expected<SessionGuard, Error> acquire(TransferSession& session);

        ~SessionGuard();
        SessionGuard(SessionGuard const&) = delete;
        SessionGuard& operator=(SessionGuard const&) = delete;
        SessionGuard(SessionGuard&& other) noexcept;
        SessionGuard& operator=(SessionGuard&& other) noexcept;

        TransferSession& session() const
        {
            return *session_;
        }
        TransferSession* operator->() const
        {
            return session_;
        }

        /**
         * @brief Closes the session now instead of on destruction.
         */
        void release();

      private:
        explicit SessionGuard(TransferSession& session);

      private:
        TransferSession* session_;
    };
}
