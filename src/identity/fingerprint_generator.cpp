#include "fingerprint_generator.hpp"
#include <memory>
#include "../core/logger/logger.hpp"

namespace Umbra {
namespace Identity {

using namespace Umbra::Core;

namespace {

const std::vector<std::string> FIREFOX_AGENTS = {
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:109.0) Gecko/20100101 Firefox/117.0",
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10.15; rv:109.0) Gecko/20100101 Firefox/117.0",
    "Mozilla/5.0 (X11; Linux x86_64; rv:109.0) Gecko/20100101 Firefox/117.0",
    "Mozilla/5.0 (Android 13; Mobile; rv:109.0) Gecko/117.0 Firefox/117.0",
    "Mozilla/5.0 (Windows NT 10.0; rv:102.0) Gecko/20100101 Firefox/102.0"};

const std::vector<std::string> CHROMIUM_AGENTS = {
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/116.0.0.0 Safari/537.36",
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/116.0.0.0 Safari/537.36",
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/116.0.0.0 Safari/537.36",
    "Mozilla/5.0 (Linux; Android 10) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/116.0.0.0 Mobile Safari/537.36"};

const std::vector<std::string> EDGE_AGENTS = {
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/116.0.0.0 Safari/537.36 Edg/116.0.1938.69"};

const std::vector<std::string> OPERA_AGENTS = {
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/115.0.0.0 Safari/537.36 OPR/101.0.0.0"};

const std::vector<std::string> SAFARI_AGENTS = {
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) "
    "Version/16.5.2 Safari/605.1.15",
    "Mozilla/5.0 (iPhone; CPU iPhone OS 16_6 like Mac OS X) AppleWebKit/605.1.15 (KHTML, like "
    "Gecko) Version/16.6 Mobile/15E148 Safari/604.1"};

const std::vector<std::string> ACCEPT_LANGUAGES = {"en-US,en;q=0.9",
                                                   "en-GB,en;q=0.9",
                                                   "en-CA,en;q=0.9,fr-CA;q=0.8,fr;q=0.7",
                                                   "en;q=0.9",
                                                   "de-DE,de;q=0.9,en-US;q=0.8,en;q=0.7",
                                                   "fr-FR,fr;q=0.9,en-US;q=0.8,en;q=0.7",
                                                   "es-ES,es;q=0.9,en-US;q=0.8,en;q=0.7",
                                                   "zh-CN,zh;q=0.9,en-US;q=0.8,en;q=0.7",
                                                   "ja-JP,ja;q=0.9,en-US;q=0.8,en;q=0.7",
                                                   "ru-RU,ru;q=0.9,en-US;q=0.8,en;q=0.7"};

constexpr const char* ACCEPT =
    "text/html,application/xhtml+xml,application/xml;q=0.9,image/webp,*/*;q=0.8";

const std::vector<std::string>& agents_for(TlsProfile profile) {
    switch (profile) {
        case TlsProfile::Firefox102:
        case TlsProfile::Firefox108: return FIREFOX_AGENTS;
        case TlsProfile::Safari16: return SAFARI_AGENTS;
        case TlsProfile::Edge106: return EDGE_AGENTS;
        case TlsProfile::Opera90: return OPERA_AGENTS;
        default: return CHROMIUM_AGENTS;
    }
}

template <typename T>
const T& pick(const std::vector<T>& values, std::mt19937_64& rng) {
    std::uniform_int_distribution<size_t> dist(0, values.size() - 1);
    return values[dist(rng)];
}

bool chance(double probability, std::mt19937_64& rng) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng) < probability;
}

std::unique_ptr<std::mt19937_64> make_engine() {
    try {
        std::random_device device;
        std::seed_seq      seed{device(), device(), device(), device()};
        return std::make_unique<std::mt19937_64>(seed);
    } catch (const std::exception& e) {
        Logger::warn("Randomness source unavailable, using default identity: "
                     + std::string(e.what()));
        return nullptr;
    }
}

}  // namespace

std::string IdentityProfile::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (key == name)
            return value;
    }
    return "";
}

FingerprintGenerator::FingerprintGenerator(std::chrono::milliseconds max_jitter)
    : max_jitter_(max_jitter.count() < 0 ? std::chrono::milliseconds(0) : max_jitter) {
}

IdentityProfile FingerprintGenerator::generate() const {
    thread_local std::unique_ptr<std::mt19937_64> engine = make_engine();
    if (!engine)
        return default_identity();
    return generate(*engine);
}

IdentityProfile FingerprintGenerator::generate(std::mt19937_64& rng) const {
    IdentityProfile profile;
    std::vector<TlsProfile> profiles(ALL_TLS_PROFILES.begin(), ALL_TLS_PROFILES.end());
    profile.tls_profile = pick(profiles, rng);

    bool is_firefox = profile.tls_profile == TlsProfile::Firefox102
                      || profile.tls_profile == TlsProfile::Firefox108;

    profile.headers.emplace_back("User-Agent", pick(agents_for(profile.tls_profile), rng));
    profile.headers.emplace_back("Accept", ACCEPT);
    profile.headers.emplace_back("Accept-Language", pick(ACCEPT_LANGUAGES, rng));
    profile.headers.emplace_back("Accept-Encoding", "identity");
    if (chance(0.3, rng))
        profile.headers.emplace_back("DNT", "1");
    profile.headers.emplace_back("Upgrade-Insecure-Requests", "1");
    profile.headers.emplace_back("Sec-Fetch-Dest", chance(0.5, rng) ? "document" : "empty");
    profile.headers.emplace_back("Sec-Fetch-Mode", chance(0.5, rng) ? "navigate" : "cors");
    profile.headers.emplace_back("Sec-Fetch-Site", chance(0.5, rng) ? "none" : "same-origin");
    profile.headers.emplace_back("Sec-Fetch-User", "?1");
    if (is_firefox || chance(0.5, rng)) {
        profile.headers.emplace_back("Pragma", "no-cache");
        profile.headers.emplace_back("Cache-Control", "no-cache");
    }
    if (chance(0.2, rng))
        profile.headers.emplace_back("Connection", "keep-alive");

    if (max_jitter_.count() > 0) {
        std::uniform_int_distribution<long long> dist(0, max_jitter_.count());
        profile.jitter = std::chrono::milliseconds(dist(rng));
    }
    return profile;
}

IdentityProfile FingerprintGenerator::default_identity() {
    IdentityProfile profile;
    profile.tls_profile = TlsProfile::Firefox102;
    profile.headers     = {{"User-Agent", FIREFOX_AGENTS.back()},
                           {"Accept", ACCEPT},
                           {"Accept-Language", "en-US,en;q=0.5"},
                           {"Accept-Encoding", "identity"},
                           {"Upgrade-Insecure-Requests", "1"}};
    return profile;
}

}  // namespace Identity
}  // namespace Umbra
