// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#include "relay/address_rewriter.hpp"
#include "util/base64.hpp"
#include "util/logging.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <cctype>
#include <charconv>
#include <nlohmann/json.hpp>
#include <vector>

namespace kvmrelay {
namespace relay {

using json = nlohmann::json;

namespace {

std::vector<std::string> SplitSpaces(const std::string &s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    size_t sp = s.find(' ', start);
    out.push_back(s.substr(start, sp - start));
    if (sp == std::string::npos) {
      break;
    }
    start = sp + 1;
  }
  return out;
}

std::string JoinSpaces(const std::vector<std::string> &tokens) {
  std::string out;
  for (size_t i = 0; i < tokens.size(); i++) {
    if (i > 0) {
      out += ' ';
    }
    out += tokens[i];
  }
  return out;
}

uint16_t ParsePort(const std::string &s) {
  unsigned int port = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), port);
  if (ec != std::errc() || ptr != s.data() + s.size() || port == 0 ||
      port > 65535) {
    return 0;
  }
  return static_cast<uint16_t>(port);
}

bool StartsWith(const std::string &s, const char *prefix) {
  return s.rfind(prefix, 0) == 0;
}

} // namespace

AddressRewriter::AddressRewriter(RewriteTarget target, PortReporter reporter)
    : target_(std::move(target)), reporter_(std::move(reporter)) {}

bool AddressRewriter::ShouldRewrite(const std::string &address) const {
  boost::system::error_code ec;
  auto addr = boost::asio::ip::make_address_v4(address, ec);
  if (ec) {
    return false;
  }
  if (addr.is_unspecified() || addr.is_loopback()) {
    return false;
  }
  if (address == target_.relay_ip) {
    return false;
  }
  if (!target_.device_ip.empty()) {
    return address == target_.device_ip;
  }

  const auto b = addr.to_bytes();
  return b[0] == 10 || (b[0] == 172 && (b[1] & 0xF0) == 16) ||
         (b[0] == 192 && b[1] == 168) || (b[0] == 169 && b[1] == 254);
}

void AddressRewriter::Report(uint16_t port) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reported_.insert(port).second) {
      return;
    }
  }
  LOG_RELAY_DEBUG("reporting device media port {}", port);
  if (!reporter_) {
    return;
  }
  try {
    reporter_(port);
  } catch (const std::exception &e) {
    LOG_RELAY_WARN("port report for {} failed: {}", port, e.what());
  }
}

std::set<uint16_t> AddressRewriter::reported_ports() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reported_;
}

void AddressRewriter::ResetSession() {
  std::lock_guard<std::mutex> lock(mutex_);
  reported_.clear();
}

std::string AddressRewriter::RewriteCandidate(const std::string &candidate) {
  std::string line = candidate;
  std::string suffix;
  if (!line.empty() && line.back() == '\r') {
    suffix = "\r";
    line.pop_back();
  }

  // foundation component transport priority address port typ type [...]
  auto tokens = SplitSpaces(line);
  if (tokens.size() < 6 || tokens[0].find("candidate:") == std::string::npos) {
    return candidate;
  }

  bool changed = false;
  uint16_t original_port = 0;

  if (ShouldRewrite(tokens[4])) {
    tokens[4] = target_.relay_ip;
    changed = true;

    std::string transport = tokens[2];
    for (auto &c : transport) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (transport == "udp" && target_.udp_listen_port != 0) {
      original_port = ParsePort(tokens[5]);
      tokens[5] = std::to_string(target_.udp_listen_port);
    }
  }

  for (size_t i = 6; i + 1 < tokens.size(); i++) {
    if (tokens[i] == "raddr" && ShouldRewrite(tokens[i + 1])) {
      tokens[i + 1] = target_.relay_ip;
      changed = true;
    }
  }

  if (!changed) {
    return candidate;
  }
  if (original_port != 0) {
    Report(original_port);
  }
  return JoinSpaces(tokens) + suffix;
}

std::string AddressRewriter::RewriteSdp(const std::string &sdp) {
  std::string out;
  out.reserve(sdp.size());

  size_t start = 0;
  while (start < sdp.size()) {
    size_t nl = sdp.find('\n', start);
    std::string line = sdp.substr(
        start, nl == std::string::npos ? std::string::npos : nl - start);
    std::string ending = nl == std::string::npos ? "" : "\n";
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
      ending = "\r" + ending;
    }

    if (StartsWith(line, "a=candidate:")) {
      line = RewriteCandidate(line);
    } else if (StartsWith(line, "c=")) {
      // c=IN IP4 <address>
      auto tokens = SplitSpaces(line);
      if (tokens.size() >= 3 && tokens[1] == "IP4" &&
          ShouldRewrite(tokens[2])) {
        tokens[2] = target_.relay_ip;
        line = JoinSpaces(tokens);
      }
    } else if (StartsWith(line, "o=")) {
      // o=<user> <sess-id> <sess-version> IN IP4 <address>
      auto tokens = SplitSpaces(line);
      if (tokens.size() >= 6 && tokens[4] == "IP4" &&
          ShouldRewrite(tokens[5])) {
        tokens[5] = target_.relay_ip;
        line = JoinSpaces(tokens);
      }
    } else if (StartsWith(line, "a=rtcp:")) {
      // a=rtcp:<port> IN IP4 <address>
      auto tokens = SplitSpaces(line);
      if (tokens.size() >= 4 && tokens[2] == "IP4" &&
          ShouldRewrite(tokens[3])) {
        tokens[3] = target_.relay_ip;
        if (target_.udp_listen_port != 0) {
          tokens[0] = "a=rtcp:" + std::to_string(target_.udp_listen_port);
        }
        line = JoinSpaces(tokens);
      }
    }

    out += line;
    out += ending;
    if (nl == std::string::npos) {
      break;
    }
    start = nl + 1;
  }
  return out;
}

std::string AddressRewriter::RewriteEncodedDescription(const std::string &encoded,
                                                       bool *changed) {
  auto decoded = util::DecodeBase64(encoded);
  if (!decoded) {
    return encoded;
  }
  json inner = json::parse(*decoded, nullptr, false);
  if (inner.is_discarded() || !inner.is_object()) {
    return encoded;
  }
  auto sdp = inner.find("sdp");
  if (sdp == inner.end() || !sdp->is_string()) {
    return encoded;
  }

  const std::string original = sdp->get<std::string>();
  std::string rewritten = RewriteSdp(original);
  if (rewritten == original) {
    return encoded;
  }
  *sdp = rewritten;
  *changed = true;
  return util::EncodeBase64(inner.dump());
}

std::string AddressRewriter::RewriteSignalingMessage(const std::string &message) {
  json msg = json::parse(message, nullptr, false);
  if (msg.is_discarded() || !msg.is_object()) {
    return message;
  }

  auto type_it = msg.find("type");
  auto data_it = msg.find("data");
  if (type_it == msg.end() || !type_it->is_string() || data_it == msg.end()) {
    return message;
  }

  const std::string type = type_it->get<std::string>();
  json &data = *data_it;
  bool changed = false;

  auto rewrite_field = [&](json &field, auto rewrite) {
    if (!field.is_string()) {
      return;
    }
    const std::string original = field.get<std::string>();
    std::string rewritten = rewrite(original);
    if (rewritten != original) {
      field = rewritten;
      changed = true;
    }
  };

  if (type == "new-ice-candidate") {
    auto cand = [this](const std::string &c) { return RewriteCandidate(c); };
    if (data.is_object() && data.contains("candidate")) {
      rewrite_field(data["candidate"], cand);
    } else {
      rewrite_field(data, cand);
    }
  } else if (type == "offer" || type == "answer") {
    if (data.is_string()) {
      data = RewriteEncodedDescription(data.get<std::string>(), &changed);
    } else if (data.is_object()) {
      if (data.contains("sdp")) {
        rewrite_field(data["sdp"],
                      [this](const std::string &s) { return RewriteSdp(s); });
      }
      if (data.contains("sd") && data["sd"].is_string()) {
        data["sd"] =
            RewriteEncodedDescription(data["sd"].get<std::string>(), &changed);
      }
    }
  }

  if (!changed) {
    return message;
  }
  return msg.dump();
}

} // namespace relay
} // namespace kvmrelay
