// =============================================================================
// cidc-upload - TLS Client Setup Tests
// =============================================================================
// Checks the OpenSSL settings applied before every HTTPS handshake.
// =============================================================================

#include "cidc/api/http_transport.h"

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>

namespace cidc::api {
namespace {

struct SslCtxDeleter {
    void operator()(SSL_CTX* ctx) const { SSL_CTX_free(ctx); }
};

struct SslDeleter {
    void operator()(SSL* ssl) const { SSL_free(ssl); }
};

class TlsClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        ctx_.reset(SSL_CTX_new(TLS_client_method()));
        ASSERT_NE(ctx_, nullptr);
        ssl_.reset(SSL_new(ctx_.get()));
        ASSERT_NE(ssl_, nullptr);
    }

    std::unique_ptr<SSL_CTX, SslCtxDeleter> ctx_;
    std::unique_ptr<SSL, SslDeleter> ssl_;
};

TEST_F(TlsClientTest, VerifiesPeerAndHostName) {
    ASSERT_TRUE(configureTlsClient(ssl_.get(), "api.example.org").has_value());

    EXPECT_NE(SSL_get_verify_mode(ssl_.get()) & SSL_VERIFY_PEER, 0);

    const char* pinned = X509_VERIFY_PARAM_get0_host(SSL_get0_param(ssl_.get()), 0);
    ASSERT_NE(pinned, nullptr);
    EXPECT_EQ(std::string(pinned), "api.example.org");

    const char* serverName = SSL_get_servername(ssl_.get(), TLSEXT_NAMETYPE_host_name);
    ASSERT_NE(serverName, nullptr);
    EXPECT_EQ(std::string(serverName), "api.example.org");
}

TEST_F(TlsClientTest, ReconfiguringReplacesPinnedHost) {
    ASSERT_TRUE(configureTlsClient(ssl_.get(), "old.example.org").has_value());
    ASSERT_TRUE(configureTlsClient(ssl_.get(), "new.example.org").has_value());

    EXPECT_EQ(std::string(X509_VERIFY_PARAM_get0_host(SSL_get0_param(ssl_.get()), 0)),
              "new.example.org");
    EXPECT_EQ(X509_VERIFY_PARAM_get0_host(SSL_get0_param(ssl_.get()), 1), nullptr);
}

}  // namespace
}  // namespace cidc::api
