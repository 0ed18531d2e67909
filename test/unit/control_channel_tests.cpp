// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/control_channel.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace kvmrelay::relay::control;

TEST_CASE("ClassifyRequestHead recognizes a port report", "[unit][control]") {
    auto c = ClassifyRequestHead(
        "GET /_relay/set-media-port?port=55123 HTTP/1.1\r\nHost: 10.147.20.5\r\n\r\n");
    CHECK(c.kind == RequestKind::SET_MEDIA_PORT);
    CHECK(c.port == 55123);
}

TEST_CASE("ClassifyRequestHead waits for the request line", "[unit][control]") {
    CHECK(ClassifyRequestHead("").kind == RequestKind::INCOMPLETE);
    CHECK(ClassifyRequestHead("G").kind == RequestKind::INCOMPLETE);
    CHECK(ClassifyRequestHead("GET /_re").kind == RequestKind::INCOMPLETE);
    CHECK(ClassifyRequestHead("OPTI").kind == RequestKind::INCOMPLETE);
    CHECK(ClassifyRequestHead("GET /_relay/set-media-port?port=55").kind ==
          RequestKind::INCOMPLETE);
}

TEST_CASE("ClassifyRequestHead treats other traffic as opaque", "[unit][control]") {
    CHECK(ClassifyRequestHead("GET / HTTP/1.1\r\n").kind == RequestKind::OPAQUE);
    CHECK(ClassifyRequestHead("GET /webrtc").kind == RequestKind::OPAQUE);
    CHECK(ClassifyRequestHead("POST /_relay/set-media-port?port=1").kind ==
          RequestKind::OPAQUE);
    CHECK(ClassifyRequestHead("\x16\x03\x01").kind == RequestKind::OPAQUE);
    CHECK(ClassifyRequestHead("get /_relay/set-media-port").kind == RequestKind::OPAQUE);
}

TEST_CASE("ClassifyRequestHead rejects bad ports", "[unit][control]") {
    CHECK(ClassifyRequestHead("GET /_relay/set-media-port HTTP/1.1\r\n").kind ==
          RequestKind::BAD_REQUEST);
    CHECK(ClassifyRequestHead("GET /_relay/set-media-port?port=abc HTTP/1.1\r\n").kind ==
          RequestKind::BAD_REQUEST);
    CHECK(ClassifyRequestHead("GET /_relay/set-media-port?port=0 HTTP/1.1\r\n").kind ==
          RequestKind::BAD_REQUEST);
    CHECK(ClassifyRequestHead("GET /_relay/set-media-port?port=65536 HTTP/1.1\r\n").kind ==
          RequestKind::BAD_REQUEST);
    CHECK(ClassifyRequestHead("GET /_relay/set-media-port?port=-5 HTTP/1.1\r\n").kind ==
          RequestKind::BAD_REQUEST);
}

TEST_CASE("ClassifyRequestHead gives up on an endless request line", "[unit][control]") {
    std::string head = "GET /_relay/set-media-port?port=1";
    head.append(MAX_REQUEST_LINE, 'x');
    CHECK(ClassifyRequestHead(head).kind == RequestKind::BAD_REQUEST);
}

TEST_CASE("ClassifyRequestHead answers CORS preflight", "[unit][control]") {
    auto c = ClassifyRequestHead("OPTIONS /_relay/set-media-port?port=55123 HTTP/1.1\r\n");
    CHECK(c.kind == RequestKind::PREFLIGHT);
}

TEST_CASE("ParsePortQuery finds the port among other parameters", "[unit][control]") {
    CHECK(ParsePortQuery("/_relay/set-media-port?port=1") == 1);
    CHECK(ParsePortQuery("/_relay/set-media-port?port=65535") == 65535);
    CHECK(ParsePortQuery("/_relay/set-media-port?t=123&port=4000&x=y") == 4000);
    CHECK(ParsePortQuery("/_relay/set-media-port?portx=5") == 0);
    CHECK(ParsePortQuery("/_relay/set-media-port?port=") == 0);
    CHECK(ParsePortQuery("/_relay/set-media-port?port=123456") == 0);
    CHECK(ParsePortQuery("/_relay/set-media-port") == 0);
}

TEST_CASE("Fixed responses carry CORS and a correct length", "[unit][control]") {
    const std::string& ok = OkResponse();
    CHECK(ok.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    CHECK(ok.find("Access-Control-Allow-Origin: *") != std::string::npos);
    CHECK(ok.find("Connection: close") != std::string::npos);

    auto body_of = [](const std::string& r) { return r.substr(r.find("\r\n\r\n") + 4); };
    CHECK(body_of(ok) == "{\"status\":\"ok\"}");
    CHECK(ok.find("Content-Length: " + std::to_string(body_of(ok).size())) != std::string::npos);

    const std::string& bad = BadRequestResponse();
    CHECK(bad.rfind("HTTP/1.1 400", 0) == 0);
    CHECK(bad.find("Content-Length: " + std::to_string(body_of(bad).size())) != std::string::npos);

    CHECK(PreflightResponse().rfind("HTTP/1.1 204", 0) == 0);
}

TEST_CASE("Port report URL", "[unit][control]") {
    CHECK(BuildSetMediaPortTarget(55123) == "/_relay/set-media-port?port=55123");
    CHECK(BuildSetMediaPortUrl("10.147.20.5", 18100, 55123) ==
          "http://10.147.20.5:18100/_relay/set-media-port?port=55123");

    // What the peer sends is what the relay accepts
    auto c = ClassifyRequestHead("GET " + BuildSetMediaPortTarget(4242) + " HTTP/1.1\r\n");
    CHECK(c.kind == RequestKind::SET_MEDIA_PORT);
    CHECK(c.port == 4242);
}
