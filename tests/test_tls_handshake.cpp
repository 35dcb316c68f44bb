#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "h2_pool/connection/connection_manager.hpp"
#include "h2_pool/connection/connector.hpp"
#include "test_support.hpp"
#include "tls_test_server.hpp"

using namespace h2_pool;
using namespace h2_pool::test;
using namespace std::chrono_literals;

namespace {

    struct TlsHandshakeTest : ::testing::Test {
        boost::asio::io_context ioc;
        std::shared_ptr<CountingTransportFactory> factory =
            std::make_shared<CountingTransportFactory>();

        std::shared_ptr<boost::asio::ssl::context> trusting(
            const TestCertificate& cert) {
            auto ctx = std::make_shared<boost::asio::ssl::context>(
                boost::asio::ssl::context::tls_client);
            trust(*ctx, cert);
            return ctx;
        }
    };

    TEST_F(TlsHandshakeTest, TrustedCertificateReachesTheFactory) {
        const auto cert = make_self_signed_certificate("127.0.0.1", "IP:127.0.0.1");
        TlsTestServer server(ioc, cert);
        TlsConnector connector(ioc.get_executor(), factory);

        int consulted = 0;
        ClientSetting setting;
        setting.context = trusting(cert);
        setting.on_bad_certificate = [&](X509*) {
            ++consulted;
            return false;
        };
        const Authority target{"127.0.0.1", server.port()};
        const RequestOptions options{"https://127.0.0.1/", 1000ms};

        auto r = run_until_complete(ioc,
                                    connector.connect(target, options, setting));

        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(r->has_value()) << r->error().message;
        EXPECT_EQ(factory->wraps, 1);
        EXPECT_EQ(consulted, 0);

        run_until(ioc, [&] { return server.state().done; }, 1000ms);
        EXPECT_TRUE(server.state().handshake_ok);
        EXPECT_EQ(server.state().alpn, "h2");
    }

    // A caller context starts out with SSL_VERIFY_NONE; the host name must
    // still be checked.
    TEST_F(TlsHandshakeTest, CallerContextStillRejectsHostMismatch) {
        const auto cert = make_self_signed_certificate("other.test", "DNS:other.test");
        TlsTestServer server(ioc, cert);
        TlsConnector connector(ioc.get_executor(), factory);

        int consulted = 0;
        ClientSetting setting;
        setting.context = trusting(cert);
        setting.on_bad_certificate = [&](X509* c) {
            ++consulted;
            EXPECT_NE(c, nullptr);
            return false;
        };
        const Authority target{"127.0.0.1", server.port()};
        const RequestOptions options{"https://127.0.0.1/", 1000ms};

        auto r = run_until_complete(ioc,
                                    connector.connect(target, options, setting));

        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(r->has_error());
        EXPECT_EQ(r->error().code, Error::Code::TlsHandshakeFailed);
        EXPECT_EQ(factory->wraps, 0);
        EXPECT_GE(consulted, 1);
    }

    TEST_F(TlsHandshakeTest, BadCertificateHookMayAccept) {
        const auto cert = make_self_signed_certificate("other.test", "DNS:other.test");
        TlsTestServer server(ioc, cert);
        TlsConnector connector(ioc.get_executor(), factory);

        int consulted = 0;
        ClientSetting setting;
        setting.context = trusting(cert);
        setting.on_bad_certificate = [&](X509*) {
            ++consulted;
            return true;
        };
        const Authority target{"127.0.0.1", server.port()};
        const RequestOptions options{"https://127.0.0.1/", 1000ms};

        auto r = run_until_complete(ioc,
                                    connector.connect(target, options, setting));

        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(r->has_value()) << r->error().message;
        EXPECT_EQ(factory->wraps, 1);
        EXPECT_GE(consulted, 1);
    }

    TEST_F(TlsHandshakeTest, DefaultContextRejectsUnknownIssuer) {
        const auto cert = make_self_signed_certificate("127.0.0.1", "IP:127.0.0.1");
        TlsTestServer server(ioc, cert);
        TlsConnector connector(ioc.get_executor(), factory);

        ClientSetting setting;
        const Authority target{"127.0.0.1", server.port()};
        const RequestOptions options{"https://127.0.0.1/", 1000ms};

        auto r = run_until_complete(ioc,
                                    connector.connect(target, options, setting));

        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(r->has_error());
        EXPECT_EQ(r->error().code, Error::Code::TlsHandshakeFailed);
        EXPECT_EQ(factory->wraps, 0);
    }

    TEST_F(TlsHandshakeTest, DisabledVerificationAcceptsUnknownIssuer) {
        const auto cert = make_self_signed_certificate("127.0.0.1", "IP:127.0.0.1");
        TlsTestServer server(ioc, cert);
        TlsConnectorConfiguration cfg;
        cfg.verify_tls = false;
        TlsConnector connector(ioc.get_executor(), factory, cfg);

        ClientSetting setting;
        const Authority target{"127.0.0.1", server.port()};
        const RequestOptions options{"https://127.0.0.1/", 1000ms};

        auto r = run_until_complete(ioc,
                                    connector.connect(target, options, setting));

        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(r->has_value()) << r->error().message;
        EXPECT_EQ(factory->wraps, 1);
    }

    TEST_F(TlsHandshakeTest, PeerWithoutH2IsRejected) {
        const auto cert = make_self_signed_certificate("127.0.0.1", "IP:127.0.0.1");
        TlsTestServer server(ioc, cert, /*select_h2=*/false);
        TlsConnector connector(ioc.get_executor(), factory);

        ClientSetting setting;
        setting.context = trusting(cert);
        const Authority target{"127.0.0.1", server.port()};
        const RequestOptions options{"https://127.0.0.1/", 1000ms};

        auto r = run_until_complete(ioc,
                                    connector.connect(target, options, setting));

        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(r->has_error());
        EXPECT_EQ(r->error().code, Error::Code::TlsHandshakeFailed);
        EXPECT_NE(r->error().message.find("h2"), std::string::npos);
        EXPECT_EQ(factory->wraps, 0);
    }

    TEST_F(TlsHandshakeTest, ManagerCachesHandshakenConnection) {
        const auto cert = make_self_signed_certificate("127.0.0.1", "IP:127.0.0.1");
        TlsTestServer server(ioc, cert);
        auto ctx = trusting(cert);

        ConnectionManagerConfiguration cfg;
        cfg.on_client_create = [ctx](const UrlComponents&, ClientSetting& setting) {
            setting.context = ctx;
        };
        ConnectionManager manager(ioc.get_executor(), factory, cfg);

        const std::string uri = "https://127.0.0.1:" + server.port() + "/";
        auto first = run_until_complete(
            ioc, manager.get_connection(RequestOptions{uri, 1000ms}));
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(first->has_value()) << first->error().message;

        auto second = run_until_complete(
            ioc, manager.get_connection(RequestOptions{uri, 1000ms}));
        ASSERT_TRUE(second.has_value());
        ASSERT_TRUE(second->has_value());

        EXPECT_EQ(first->value(), second->value());
        EXPECT_EQ(factory->wraps, 1);
        EXPECT_EQ(manager.cached_count(), 1u);
        EXPECT_TRUE(manager.has_connection(Authority{"127.0.0.1", server.port()}));
    }

}  // namespace
