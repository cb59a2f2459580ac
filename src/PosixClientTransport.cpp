/**
 * @file PosixClientTransport.cpp
 *
 * This module contains the implementation of the
 * Retrieval::PosixClientTransport class.
 *
 * © 2018 by Richard Walters
 */

#include <arpa/inet.h>
#include <chrono>
#include <errno.h>
#include <fcntl.h>
#include <inttypes.h>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <Retrieval/PosixClientTransport.hpp>
#include <string.h>
#include <string>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <SystemAbstractions/StringExtensions.hpp>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

    /**
     * This is the default time allowed to establish a connection,
     * in seconds.
     */
    constexpr double DEFAULT_CONNECT_TIMEOUT_SECONDS = 10.0;

    /**
     * This is the default number of bytes to ask for in each read
     * from the network.
     */
    constexpr size_t DEFAULT_RECEIVE_BUFFER_SIZE = 65536;

    /**
     * This function switches the given socket between blocking
     * and non-blocking mode.
     *
     * @param[in] sock
     *     This is the socket to change.
     *
     * @param[in] nonBlocking
     *     This indicates whether or not the socket should be put
     *     in non-blocking mode.
     *
     * @return
     *     An indication of whether or not the change was made is returned.
     */
    bool SetNonBlocking(int sock, bool nonBlocking) {
        const int flags = fcntl(sock, F_GETFL, 0);
        if (flags < 0) {
            return false;
        }
        const int newFlags = (
            nonBlocking
            ? (flags | O_NONBLOCK)
            : (flags & ~O_NONBLOCK)
        );
        return (fcntl(sock, F_SETFL, newFlags) == 0);
    }

    /**
     * This function attempts to connect the given socket to the given
     * address, giving up after the given amount of time.
     *
     * @param[in] sock
     *     This is the socket to connect.
     *
     * @param[in] address
     *     This is the address to which to connect.
     *
     * @param[in] timeout
     *     This is the time allowed to establish the connection, in seconds.
     *
     * @param[out] error
     *     If the connection fails, this is where to store the reason.
     *
     * @return
     *     An indication of whether or not the socket was connected
     *     is returned.
     */
    bool ConnectWithTimeout(
        int sock,
        const struct addrinfo* address,
        double timeout,
        std::string& error
    ) {
        if (!SetNonBlocking(sock, true)) {
            error = SystemAbstractions::sprintf("fcntl failed: %s", strerror(errno));
            return false;
        }
        if (connect(sock, address->ai_addr, address->ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                error = SystemAbstractions::sprintf("connect failed: %s", strerror(errno));
                return false;
            }
            fd_set writeSet;
            FD_ZERO(&writeSet);
            FD_SET(sock, &writeSet);
            struct timeval timeoutInterval;
            timeoutInterval.tv_sec = (time_t)timeout;
            timeoutInterval.tv_usec = (suseconds_t)((timeout - (double)timeoutInterval.tv_sec) * 1000000.0);
            const auto selectResult = select(sock + 1, NULL, &writeSet, NULL, &timeoutInterval);
            if (selectResult == 0) {
                error = "connect timed out";
                return false;
            } else if (selectResult < 0) {
                error = SystemAbstractions::sprintf("select failed: %s", strerror(errno));
                return false;
            }
            int socketError = 0;
            socklen_t socketErrorLength = sizeof(socketError);
            if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &socketError, &socketErrorLength) != 0) {
                error = SystemAbstractions::sprintf("getsockopt failed: %s", strerror(errno));
                return false;
            }
            if (socketError != 0) {
                error = SystemAbstractions::sprintf("connect failed: %s", strerror(socketError));
                return false;
            }
        }
        if (!SetNonBlocking(sock, false)) {
            error = SystemAbstractions::sprintf("fcntl failed: %s", strerror(errno));
            return false;
        }
        return true;
    }

    /**
     * This holds the state of a connection which is shared between
     * the connection object and the thread which reads from the socket.
     */
    struct PosixConnectionState {
        // Properties

        /**
         * This is the socket of the connection.
         */
        int sock = -1;

        /**
         * This identifies the peer of the connection.
         */
        std::string peerId;

        /**
         * This is the number of bytes to ask for in each read.
         */
        size_t receiveBufferSize = DEFAULT_RECEIVE_BUFFER_SIZE;

        /**
         * This is the delegate to call whenever data is received
         * from the remote peer.
         */
        Retrieval::Connection::DataReceivedDelegate dataReceivedDelegate;

        /**
         * This is the delegate to call whenever the connection
         * has been broken.
         */
        Retrieval::Connection::BrokenDelegate brokenDelegate;

        /**
         * This flag indicates whether or not the connection was
         * broken from this end.
         */
        bool brokenLocally = false;

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        std::shared_ptr< SystemAbstractions::DiagnosticsSender > diagnosticsSender;

        /**
         * This is used to synchronize access to the object.
         */
        std::mutex mutex;

        // Lifecycle management

        ~PosixConnectionState() noexcept {
            if (sock >= 0) {
                (void)close(sock);
            }
        }
        PosixConnectionState(const PosixConnectionState&) = delete;
        PosixConnectionState(PosixConnectionState&&) noexcept = delete;
        PosixConnectionState& operator=(const PosixConnectionState&) = delete;
        PosixConnectionState& operator=(PosixConnectionState&&) noexcept = delete;

        // Methods

        /**
         * This is the default constructor.
         */
        PosixConnectionState() = default;

        /**
         * This method reads from the socket until the connection
         * is broken, delivering data as it arrives.
         *
         * @param[in] self
         *     This keeps the state alive for as long as the reader runs.
         */
        static void Reader(std::shared_ptr< PosixConnectionState > self) {
            std::vector< uint8_t > buffer(self->receiveBufferSize);
            bool graceful = false;
            for (;;) {
                const auto amountReceived = recv(self->sock, buffer.data(), buffer.size(), 0);
                if (amountReceived > 0) {
                    {
                        std::lock_guard< decltype(self->mutex) > lock(self->mutex);
                        if (self->brokenLocally) {
                            return;
                        }
                    }
                    self->dataReceivedDelegate(
                        std::vector< uint8_t >(
                            buffer.begin(),
                            buffer.begin() + amountReceived
                        )
                    );
                } else if (amountReceived == 0) {
                    graceful = true;
                    break;
                } else if (errno != EINTR) {
                    self->diagnosticsSender->SendDiagnosticInformationFormatted(
                        5,
                        "%s: recv failed: %s",
                        self->peerId.c_str(),
                        strerror(errno)
                    );
                    break;
                }
            }
            {
                std::lock_guard< decltype(self->mutex) > lock(self->mutex);
                if (self->brokenLocally) {
                    return;
                }
            }
            self->diagnosticsSender->SendDiagnosticInformationFormatted(
                1,
                "%s: connection closed by peer",
                self->peerId.c_str()
            );
            self->brokenDelegate(graceful);
        }
    };

    /**
     * This is the implementation of Retrieval::Connection used
     * by the POSIX transport.
     */
    class PosixConnection
        : public Retrieval::Connection
    {
        // Lifecycle management
    public:
        ~PosixConnection() noexcept {
            Break(false);
            if (reader_.joinable()) {
                if (reader_.get_id() == std::this_thread::get_id()) {
                    reader_.detach();
                } else {
                    reader_.join();
                }
            }
        }
        PosixConnection(const PosixConnection&) = delete;
        PosixConnection(PosixConnection&&) noexcept = delete;
        PosixConnection& operator=(const PosixConnection&) = delete;
        PosixConnection& operator=(PosixConnection&&) noexcept = delete;

        // Public methods
    public:
        /**
         * This constructs the connection and starts reading from it.
         *
         * @param[in] state
         *     This is the state of a connected socket.
         */
        explicit PosixConnection(std::shared_ptr< PosixConnectionState > state)
            : state_(state)
        {
            reader_ = std::thread(&PosixConnectionState::Reader, state_);
        }

        // Retrieval::Connection

        virtual std::string GetPeerId() override {
            return state_->peerId;
        }

        virtual void SendData(const std::vector< uint8_t >& data) override {
            size_t amountSent = 0;
            while (amountSent < data.size()) {
                const auto result = send(
                    state_->sock,
                    data.data() + amountSent,
                    data.size() - amountSent,
                    MSG_NOSIGNAL
                );
                if (result < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    state_->diagnosticsSender->SendDiagnosticInformationFormatted(
                        5,
                        "%s: send failed: %s",
                        state_->peerId.c_str(),
                        strerror(errno)
                    );
                    return;
                }
                amountSent += (size_t)result;
            }
        }

        virtual void Break(bool) override {
            std::lock_guard< decltype(state_->mutex) > lock(state_->mutex);
            if (state_->brokenLocally) {
                return;
            }
            state_->brokenLocally = true;
            (void)shutdown(state_->sock, SHUT_RDWR);
        }

        // Private properties
    private:
        /**
         * This is the state shared with the reader thread.
         */
        std::shared_ptr< PosixConnectionState > state_;

        /**
         * This thread reads from the socket.
         */
        std::thread reader_;
    };

}

namespace Retrieval {

    /**
     * This contains the private properties of a PosixClientTransport instance.
     */
    struct PosixClientTransport::Impl {
        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        std::shared_ptr< SystemAbstractions::DiagnosticsSender > diagnosticsSender = std::make_shared< SystemAbstractions::DiagnosticsSender >("Retrieval::PosixClientTransport");

        /**
         * This is the time allowed to establish a connection, in seconds.
         */
        double connectTimeout = DEFAULT_CONNECT_TIMEOUT_SECONDS;

        /**
         * This is the number of bytes to ask for in each read
         * from the network.
         */
        size_t receiveBufferSize = DEFAULT_RECEIVE_BUFFER_SIZE;
    };

    PosixClientTransport::~PosixClientTransport() noexcept = default;

    PosixClientTransport::PosixClientTransport()
        : impl_(new Impl)
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate PosixClientTransport::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender->SubscribeToDiagnostics(delegate, minLevel);
    }

    void PosixClientTransport::SetConnectTimeout(double connectTimeout) {
        impl_->connectTimeout = connectTimeout;
    }

    void PosixClientTransport::SetReceiveBufferSize(size_t receiveBufferSize) {
        if (receiveBufferSize > 0) {
            impl_->receiveBufferSize = receiveBufferSize;
        }
    }

    std::shared_ptr< Connection > PosixClientTransport::Connect(
        const std::string& hostNameOrAddress,
        uint16_t port,
        double timeout,
        Connection::DataReceivedDelegate dataReceivedDelegate,
        Connection::BrokenDelegate brokenDelegate
    ) {
        const auto connectTimeout = (
            (
                (timeout > 0.0)
                && (timeout < impl_->connectTimeout)
            )
            ? timeout
            : impl_->connectTimeout
        );
        const auto peerId = SystemAbstractions::sprintf(
            "%s:%" PRIu16,
            hostNameOrAddress.c_str(),
            port
        );
        struct addrinfo hints;
        (void)memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        struct addrinfo* addresses = NULL;
        const auto portString = SystemAbstractions::sprintf("%" PRIu16, port);
        const auto lookupResult = getaddrinfo(
            hostNameOrAddress.c_str(),
            portString.c_str(),
            &hints,
            &addresses
        );
        if (lookupResult != 0) {
            impl_->diagnosticsSender->SendDiagnosticInformationFormatted(
                10,
                "%s: unable to resolve host name: %s",
                peerId.c_str(),
                gai_strerror(lookupResult)
            );
            return nullptr;
        }
        std::unique_ptr< struct addrinfo, void(*)(struct addrinfo*) > addressesReference(
            addresses,
            freeaddrinfo
        );
        std::string lastError = "no addresses";
        const auto deadline = (
            std::chrono::steady_clock::now()
            + std::chrono::duration_cast< std::chrono::steady_clock::duration >(
                std::chrono::duration< double >(connectTimeout)
            )
        );
        for (auto address = addresses; address != NULL; address = address->ai_next) {
            const auto timeLeft = std::chrono::duration< double >(
                deadline - std::chrono::steady_clock::now()
            ).count();
            if (timeLeft <= 0.0) {
                lastError = "connect timed out";
                break;
            }
            const auto sock = socket(address->ai_family, address->ai_socktype, address->ai_protocol);
            if (sock < 0) {
                lastError = SystemAbstractions::sprintf("socket failed: %s", strerror(errno));
                continue;
            }
            if (!ConnectWithTimeout(sock, address, timeLeft, lastError)) {
                (void)close(sock);
                continue;
            }
            const auto state = std::make_shared< PosixConnectionState >();
            state->sock = sock;
            state->peerId = peerId;
            state->receiveBufferSize = impl_->receiveBufferSize;
            state->dataReceivedDelegate = dataReceivedDelegate;
            state->brokenDelegate = brokenDelegate;
            state->diagnosticsSender = impl_->diagnosticsSender;
            impl_->diagnosticsSender->SendDiagnosticInformationFormatted(
                1,
                "%s: connected",
                peerId.c_str()
            );
            return std::make_shared< PosixConnection >(state);
        }
        impl_->diagnosticsSender->SendDiagnosticInformationFormatted(
            10,
            "%s: unable to connect: %s",
            peerId.c_str(),
            lastError.c_str()
        );
        return nullptr;
    }

}
