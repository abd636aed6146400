/**
 * Waypoint - Dynamic Reverse Proxy Decision Layer
 * ClientHello inspection tests with OpenSSL-generated and hand-built handshakes
 */

#include "server/client_hello.hpp"

#include <gtest/gtest.h>

#include <openssl/bio.h>
#include <openssl/ssl.h>

#include <cstdint>
#include <string>

using namespace waypoint::server;

namespace {

/**
 * First flight of a real OpenSSL client, captured through memory BIOs
 */
std::string openssl_client_hello(const char* server_name) {
    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    SSL* ssl = SSL_new(ctx);
    BIO* rbio = BIO_new(BIO_s_mem());
    BIO* wbio = BIO_new(BIO_s_mem());
    SSL_set_bio(ssl, rbio, wbio);
    if (server_name) {
        SSL_set_tlsext_host_name(ssl, server_name);
    }
    SSL_set_connect_state(ssl);
    SSL_do_handshake(ssl);  // Stops wanting the server's reply

    char* data = nullptr;
    long size = BIO_get_mem_data(wbio, &data);
    std::string hello(data, static_cast<std::size_t>(size));

    SSL_free(ssl);
    SSL_CTX_free(ctx);
    return hello;
}

void put16(std::string& out, std::size_t value) {
    out += static_cast<char>((value >> 8) & 0xff);
    out += static_cast<char>(value & 0xff);
}

void put24(std::string& out, std::size_t value) {
    out += static_cast<char>((value >> 16) & 0xff);
    put16(out, value & 0xffff);
}

std::string server_name_extension(const std::string& name) {
    std::string entry;
    entry += '\0';
    put16(entry, name.size());
    entry += name;

    std::string list;
    put16(list, entry.size());
    list += entry;

    std::string extension;
    put16(extension, 0x0000);
    put16(extension, list.size());
    extension += list;
    return extension;
}

std::string client_hello_body(const std::string& extensions) {
    std::string body;
    body += "\x03\x03";
    body += std::string(32, '\x11');    // random
    body += '\0';                       // session_id
    put16(body, 2);
    body += "\x00\x2f";                 // one cipher suite
    body += '\x01';
    body += '\0';                       // null compression
    if (!extensions.empty()) {
        put16(body, extensions.size());
        body += extensions;
    }
    return body;
}

std::string handshake(std::uint8_t type, const std::string& body) {
    std::string message;
    message += static_cast<char>(type);
    put24(message, body.size());
    message += body;
    return message;
}

std::string record(const std::string& fragment) {
    std::string out = "\x16\x03\x01";
    put16(out, fragment.size());
    out += fragment;
    return out;
}

} // anonymous namespace

TEST(ClientHelloTest, ExtractsLowercaseServerName) {
    auto info = inspect_client_hello(openssl_client_hello("Shop.Example.COM"));

    EXPECT_EQ(info.status, ClientHelloStatus::complete);
    EXPECT_EQ(info.server_name, "shop.example.com");
}

TEST(ClientHelloTest, HelloWithoutSniIsCompleteWithoutName) {
    auto info = inspect_client_hello(openssl_client_hello(nullptr));

    EXPECT_EQ(info.status, ClientHelloStatus::complete);
    EXPECT_TRUE(info.server_name.empty());
}

TEST(ClientHelloTest, PartialHelloIsIncomplete) {
    auto hello = openssl_client_hello("api.example.com");
    ASSERT_GT(hello.size(), 10u);

    EXPECT_EQ(inspect_client_hello("").status, ClientHelloStatus::incomplete);
    EXPECT_EQ(inspect_client_hello(hello.substr(0, 3)).status, ClientHelloStatus::incomplete);
    EXPECT_EQ(inspect_client_hello(hello.substr(0, hello.size() / 2)).status, ClientHelloStatus::incomplete);
    EXPECT_EQ(inspect_client_hello(hello.substr(0, hello.size() - 1)).status, ClientHelloStatus::incomplete);
}

TEST(ClientHelloTest, HandshakeSplitAcrossRecords) {
    auto message = handshake(0x01, client_hello_body(server_name_extension("split.test")));
    auto first = record(message.substr(0, 20));
    auto second = record(message.substr(20));

    EXPECT_EQ(inspect_client_hello(first).status, ClientHelloStatus::incomplete);

    auto info = inspect_client_hello(first + second);
    EXPECT_EQ(info.status, ClientHelloStatus::complete);
    EXPECT_EQ(info.server_name, "split.test");
}

TEST(ClientHelloTest, SkipsOtherExtensions) {
    std::string extensions;
    put16(extensions, 0x000a);      // supported_groups
    put16(extensions, 4);
    extensions += "\x00\x02\x00\x1d";
    extensions += server_name_extension("after.test");

    auto info = inspect_client_hello(record(handshake(0x01, client_hello_body(extensions))));
    EXPECT_EQ(info.status, ClientHelloStatus::complete);
    EXPECT_EQ(info.server_name, "after.test");
}

TEST(ClientHelloTest, HelloWithoutExtensionsIsComplete) {
    auto info = inspect_client_hello(record(handshake(0x01, client_hello_body(""))));

    EXPECT_EQ(info.status, ClientHelloStatus::complete);
    EXPECT_TRUE(info.server_name.empty());
}

TEST(ClientHelloTest, PlainHttpIsInvalid) {
    EXPECT_EQ(inspect_client_hello("GET / HTTP/1.1\r\nHost: example.com\r\n\r\n").status,
              ClientHelloStatus::invalid);
    EXPECT_EQ(inspect_client_hello("G").status, ClientHelloStatus::invalid);
}

TEST(ClientHelloTest, OtherHandshakeTypeIsInvalid) {
    auto server_hello = record(handshake(0x02, client_hello_body("")));

    EXPECT_EQ(inspect_client_hello(server_hello).status, ClientHelloStatus::invalid);
}

TEST(ClientHelloTest, InconsistentLengthsAreInvalid) {
    std::string extensions;
    put16(extensions, 0x0000);
    put16(extensions, 3);
    put16(extensions, 40);          // server_name_list longer than the extension
    extensions += '\0';

    auto info = inspect_client_hello(record(handshake(0x01, client_hello_body(extensions))));
    EXPECT_EQ(info.status, ClientHelloStatus::invalid);
}

TEST(ClientHelloTest, OversizedHandshakeIsInvalid) {
    std::string message;
    message += '\x01';
    put24(message, 0xffffff);
    message += std::string(16, '\0');

    EXPECT_EQ(inspect_client_hello(record(message)).status, ClientHelloStatus::invalid);
}
