#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "h2_pool/connection/connection_manager.hpp"
#include "h2_pool/connection/connector.hpp"
#include "test_support.hpp"

using namespace h2_pool;
using namespace h2_pool::test;
using namespace std::chrono_literals;

namespace {

    struct TlsConnectorTest : ::testing::Test {
        boost::asio::io_context ioc;
        std::shared_ptr<CountingTransportFactory> factory =
            std::make_shared<CountingTransportFactory>();
        TlsConnector connector{ioc.get_executor(), factory};
    };

    TEST_F(TlsConnectorTest, TunnelUpgradesToTlsAddressedToTarget) {
        FakeProxy proxy(ioc, "HTTP/1.1 200 Connection established\r\n\r\n");

        ClientSetting setting;
        setting.proxy = ProxySetting{"127.0.0.1", proxy.port(), ""};
        const Authority target{"target.test", "443"};
        const RequestOptions options{"https://target.test/", 1000ms};

        auto r = run_until_complete(ioc,
                                    connector.connect(target, options, setting));

        // The proxy hangs up after reading the ClientHello.
        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(r->has_error());
        EXPECT_EQ(r->error().code, Error::Code::TlsHandshakeFailed);
        EXPECT_EQ(factory->wraps, 0);

        const std::string& hello = proxy.state().after_reply;
        ASSERT_FALSE(hello.empty());
        EXPECT_EQ(static_cast<unsigned char>(hello[0]), 0x16);  // handshake
        EXPECT_NE(hello.find("target.test"), std::string::npos);  // SNI
        EXPECT_NE(hello.find("h2"), std::string::npos);           // ALPN
    }

    TEST_F(TlsConnectorTest, ProxyRefusalNeverReachesTheFactory) {
        FakeProxy proxy(ioc, "HTTP/1.1 403 Forbidden\r\n\r\n");

        ClientSetting setting;
        setting.proxy = ProxySetting{"127.0.0.1", proxy.port(), ""};
        const Authority target{"target.test", "443"};
        const RequestOptions options{"https://target.test/", 1000ms};

        auto r = run_until_complete(ioc,
                                    connector.connect(target, options, setting));

        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(r->has_error());
        EXPECT_EQ(r->error().code, Error::Code::ProxyTunnelFailed);
        EXPECT_EQ(factory->wraps, 0);
    }

    TEST_F(TlsConnectorTest, DirectRefusedConnectionFails) {
        ClientSetting setting;
        const Authority target{"127.0.0.1", unused_port(ioc)};
        const RequestOptions options{"https://127.0.0.1/", 1000ms};

        auto r = run_until_complete(ioc,
                                    connector.connect(target, options, setting));

        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(r->has_error());
        EXPECT_EQ(r->error().code, Error::Code::ConnectionFailed);
    }

    TEST_F(TlsConnectorTest, StalledHandshakeTimesOut) {
        // Accepts and never answers the ClientHello.
        FakeProxy mute(ioc, std::nullopt);

        ClientSetting setting;
        const Authority target{"127.0.0.1", mute.port()};
        const RequestOptions options{"https://127.0.0.1/", 200ms};

        auto r = run_until_complete(ioc,
                                    connector.connect(target, options, setting));

        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(r->has_error());
        EXPECT_EQ(r->error().code, Error::Code::ConnectTimeout);
    }

    TEST(TlsConnectorConstructionTest, RequiresFactory) {
        boost::asio::io_context ioc;
        EXPECT_THROW(TlsConnector(ioc.get_executor(), nullptr),
                     std::invalid_argument);
    }

    TEST(TlsConnectorConstructionTest, VerifyModeFollowsConfiguration) {
        boost::asio::io_context ioc;
        auto factory = std::make_shared<CountingTransportFactory>();

        TlsConnector verifying(ioc.get_executor(), factory);
        EXPECT_EQ(SSL_CTX_get_verify_mode(verifying.default_context().native_handle()),
                  SSL_VERIFY_PEER);

        TlsConnectorConfiguration cfg;
        cfg.verify_tls = false;
        TlsConnector trusting(ioc.get_executor(), factory, cfg);
        EXPECT_EQ(SSL_CTX_get_verify_mode(trusting.default_context().native_handle()),
                  SSL_VERIFY_NONE);
    }

    TEST(ConnectionManagerProxyTest, RefusingProxyLeavesNothingCached) {
        boost::asio::io_context ioc;
        FakeProxy proxy(ioc, "HTTP/1.1 403 Forbidden\r\n\r\n");
        auto factory = std::make_shared<CountingTransportFactory>();

        ConnectionManagerConfiguration cfg;
        const std::string proxy_port = proxy.port();
        cfg.on_client_create = [proxy_port](const UrlComponents&,
                                            ClientSetting& setting) {
            setting.proxy = ProxySetting{"127.0.0.1", proxy_port, ""};
        };
        ConnectionManager manager(ioc.get_executor(), factory, cfg);

        auto r = run_until_complete(
            ioc, manager.get_connection(
                     RequestOptions{"https://target.test/", 1000ms}));

        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(r->has_error());
        EXPECT_EQ(r->error().code, Error::Code::ProxyTunnelFailed);
        EXPECT_EQ(manager.cached_count(), 0u);
        EXPECT_EQ(manager.pending_count(), 0u);
        EXPECT_EQ(factory->wraps, 0);
        EXPECT_NE(proxy.state().request.find("CONNECT target.test:443 "),
                  std::string::npos);
    }

}  // namespace
