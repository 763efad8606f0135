#include "dbal/settings.hpp"
#include <cctype>
#include "dbal/lib.hpp"

namespace dbal {

namespace {

std::string decode(const std::string& s) {
    std::string out;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

std::string driver_for(const std::string& scheme) {
    if (scheme == "sqlite" || scheme == "sqlite3") return "sqlite";
    if (scheme == "postgres" || scheme == "postgresql" || scheme == "pgsql") return "postgres";
    DBAL_INVARIANT("unknown database scheme '%s'", scheme.c_str());
}

// libpq wants single quoted values with ' and \ escaped
std::string pq_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    return out + "'";
}

}

Settings Settings::fromURL(const std::string& url) {
    Settings settings;
    auto colon = url.find(':');
    if (colon == std::string::npos || colon == 0) DBAL_INVARIANT("malformed database url '%s'", url.c_str());
    settings.driver_ = driver_for(url.substr(0, colon));

    std::string rest = url.substr(colon + 1);
    if (settings.driver_ == "sqlite") {
        if (rest == ":memory:") {
            settings.path_ = ":memory:";
        } else if (rest.rfind("//", 0) == 0 && rest.size() > 2) {
            settings.path_ = decode(rest.substr(2));
        } else {
            DBAL_INVARIANT("malformed sqlite url '%s'", url.c_str());
        }
        return settings;
    }

    if (rest.rfind("//", 0) != 0) DBAL_INVARIANT("malformed database url '%s'", url.c_str());
    rest = rest.substr(2);

    if (auto q = rest.find('?'); q != std::string::npos) {
        std::string query = rest.substr(q + 1);
        rest = rest.substr(0, q);
        std::size_t start = 0;
        while (start < query.size()) {
            auto amp = query.find('&', start);
            std::string pair = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
            auto eq = pair.find('=');
            if (eq != std::string::npos && pair.substr(0, eq) == "encoding") settings.encoding_ = decode(pair.substr(eq + 1));
            if (amp == std::string::npos) break;
            start = amp + 1;
        }
    }

    if (auto slash = rest.find('/'); slash != std::string::npos) {
        settings.schema_ = decode(rest.substr(slash + 1));
        rest = rest.substr(0, slash);
    }

    if (auto at = rest.rfind('@'); at != std::string::npos) {
        std::string credentials = rest.substr(0, at);
        rest = rest.substr(at + 1);
        auto c = credentials.find(':');
        settings.user_ = decode(credentials.substr(0, c));
        if (c != std::string::npos) settings.password_ = decode(credentials.substr(c + 1));
    }

    if (auto c = rest.rfind(':'); c != std::string::npos) {
        std::string port = rest.substr(c + 1);
        std::size_t used = 0;
        try {
            settings.port_ = std::stoi(port, &used);
        } catch (const std::logic_error&) {
            DBAL_INVARIANT("bad port in database url '%s'", url.c_str());
        }
        if (used != port.size() || settings.port_ <= 0 || settings.port_ > 65535)
            DBAL_INVARIANT("bad port in database url '%s'", url.c_str());
        rest = rest.substr(0, c);
    }
    if (!rest.empty()) settings.server_ = decode(rest);
    if (settings.port_ == 0) settings.port_ = 5432;
    return settings;
}

Settings Settings::fromJson(const jval& in) {
    if (!in.IsObject()) DBAL_INVARIANT("connection settings must be an object");
    Settings settings;
    settings.driver_ = driver_for(jhlp::get<std::string>(in, "driver"));
    settings.server_ = jhlp::get<std::string>(in, "server", settings.server_);
    settings.port_ = jhlp::get<int>(in, "port", settings.driver_ == "postgres" ? 5432 : 0);
    settings.user_ = jhlp::get<std::string>(in, "user");
    settings.password_ = jhlp::get<std::string>(in, "password");
    settings.schema_ = jhlp::get<std::string>(in, "schema");
    settings.encoding_ = jhlp::get<std::string>(in, "encoding", settings.encoding_);
    settings.path_ = jhlp::get<std::string>(in, "path");
    return settings;
}

std::string Settings::conninfo() const {
    std::string out = "host=" + pq_quote(server_);
    if (port_) out += " port=" + std::to_string(port_);
    if (!schema_.empty()) out += " dbname=" + pq_quote(schema_);
    if (!user_.empty()) out += " user=" + pq_quote(user_);
    if (!password_.empty()) out += " password=" + pq_quote(password_);
    if (!encoding_.empty()) out += " client_encoding=" + pq_quote(encoding_);
    return out;
}

} // namespace dbal
