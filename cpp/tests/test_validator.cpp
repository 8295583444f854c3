#include <catch2/catch_test_macros.hpp>
#include "certvet/validator.hpp"
#include "test_pki.hpp"
#include <string>

using namespace certvet;

namespace
{
    // root -> intermediate -> leaf, plus an unrelated root
    struct Fixture
    {
        testing::Issued root = testing::issue(testing::ca_spec("Test Root CA"));
        testing::Issued intermediate = testing::issue(testing::ca_spec("Test Intermediate CA"), &root);
        testing::Issued other_root = testing::issue(testing::ca_spec("Other Root CA"));
        CertificateRegistry registry;
        Fingerprint root_fp = registry.add(root.cert);
        Fingerprint other_fp = registry.add(other_root.cert);

        CertChain chain_with(const testing::CertSpec &leaf_spec) const
        {
            auto leaf = testing::issue(leaf_spec, &intermediate);
            return CertChain{"example.test", leaf.cert, {intermediate.cert}, {}};
        }

        CertChain chain() const { return chain_with(testing::leaf_spec()); }
    };

    Store make_store(Platform platform, std::string version, std::vector<Fingerprint> fps)
    {
        Store s;
        s.platform = platform;
        s.version = std::move(version);
        s.fingerprints = std::move(fps);
        return s;
    }

    const Clock kNow = testing::fixed_clock("2025-06-01T00:00:00Z");
}

TEST_CASE("Chain anchored in the store is trusted", "[validator]")
{
    Fixture fx;
    Validator validator(fx.registry, kNow);
    auto store = make_store(Platform::IOS, "17", {fx.other_fp, fx.root_fp});

    auto result = validator.validate_against_store(fx.chain(), store);
    REQUIRE(result.trusted);
    REQUIRE(result.matched_ca == "Test Root CA");
    REQUIRE(result.failure_reason.empty());
    REQUIRE(result.verified_chain.size() == 3);
    REQUIRE(result.verified_chain.back() == fx.root.cert);
    REQUIRE(result.platform == PlatformVersion{Platform::IOS, "17"});
}

TEST_CASE("Matched CA falls back to the organization name", "[validator]")
{
    auto spec = testing::ca_spec("");
    spec.organization = "Nameless Trust Services";
    auto root = testing::issue(spec);
    auto intermediate = testing::issue(testing::ca_spec("Intermediate"), &root);
    auto leaf = testing::issue(testing::leaf_spec(), &intermediate);

    CertificateRegistry registry;
    auto fp = registry.add(root.cert);
    Validator validator(registry, kNow);

    CertChain chain{"example.test", leaf.cert, {intermediate.cert}, {}};
    auto result = validator.validate_against_store(chain, make_store(Platform::Android, "14", {fp}));
    REQUIRE(result.trusted);
    REQUIRE(result.matched_ca == "Nameless Trust Services");
}

TEST_CASE("Store without the anchoring root rejects the chain", "[validator]")
{
    Fixture fx;
    Validator validator(fx.registry, kNow);

    auto result = validator.validate_against_store(fx.chain(), make_store(Platform::IOS, "17", {fx.other_fp}));
    REQUIRE_FALSE(result.trusted);
    REQUIRE(result.failure_reason == "certificate signed by unknown authority");
    REQUIRE(result.matched_ca.empty());
}

TEST_CASE("Store with no resolvable roots", "[validator]")
{
    Fixture fx;
    Validator validator(fx.registry, kNow);
    auto unknown = Fingerprint::parse(std::string(64, 'C')).value();

    auto result = validator.validate_against_store(fx.chain(), make_store(Platform::IOS, "17", {unknown}));
    REQUIRE_FALSE(result.trusted);
    REQUIRE(result.failure_reason == "no valid root certificates in trust store");
}

TEST_CASE("Known root without certificate data is diagnosed", "[validator]")
{
    Fixture fx;
    Validator validator(fx.registry, kNow);

    // The server's last intermediate is a root the store lists but the registry lacks
    auto missing_fp = Fingerprint::from_certificate(fx.intermediate.cert);
    auto store = make_store(Platform::MacOS, "14", {fx.other_fp, missing_fp});

    auto result = validator.validate_against_store(fx.chain(), store);
    REQUIRE_FALSE(result.trusted);
    REQUIRE(result.failure_reason ==
            "chain roots at known CA (fingerprint " + missing_fp.to_string() + ") but certificate data unavailable");
}

TEST_CASE("Expired leaf is rejected", "[validator]")
{
    Fixture fx;
    auto spec = testing::leaf_spec();
    spec.not_before = parse_rfc3339("2023-01-01T00:00:00Z").value();
    spec.not_after = parse_rfc3339("2024-01-01T00:00:00Z").value();

    Validator validator(fx.registry, kNow);
    auto result = validator.validate_against_store(fx.chain_with(spec), make_store(Platform::IOS, "17", {fx.root_fp}));
    REQUIRE_FALSE(result.trusted);
    REQUIRE(result.failure_reason == "certificate has expired or is not yet valid");
}

TEST_CASE("Constraint checks", "[validator]")
{
    Fixture fx;
    auto store = make_store(Platform::IOS, "17", {fx.root_fp});

    SECTION("NotBeforeMax")
    {
        Constraints c;
        c.not_before_max = parse_rfc3339("2023-12-31T00:00:00Z").value();
        store.constraints.emplace(fx.root_fp, c);

        auto result = Validator(fx.registry, kNow).validate_against_store(fx.chain(), store);
        REQUIRE_FALSE(result.trusted);
        REQUIRE(result.failure_reason == "certificate issued after trust cutoff (2024-01-01 > 2023-12-31)");
        REQUIRE(result.matched_ca == "Test Root CA");
        REQUIRE(result.verified_chain.size() == 3);
    }

    SECTION("DistrustDate in the past")
    {
        Constraints c;
        c.distrust_date = parse_rfc3339("2025-01-01T00:00:00Z").value();
        store.constraints.emplace(fx.root_fp, c);

        auto result = Validator(fx.registry, kNow).validate_against_store(fx.chain(), store);
        REQUIRE_FALSE(result.trusted);
        REQUIRE(result.failure_reason == "CA distrusted since 2025-01-01");
    }

    SECTION("DistrustDate depends on validation time only")
    {
        Constraints c;
        c.distrust_date = parse_rfc3339("2025-01-01T00:00:00Z").value();
        store.constraints.emplace(fx.root_fp, c);
        auto chain = fx.chain();

        Validator before(fx.registry, testing::fixed_clock("2024-12-31T00:00:00Z"));
        Validator after(fx.registry, testing::fixed_clock("2025-01-02T00:00:00Z"));
        REQUIRE(before.validate_against_store(chain, store).trusted);
        REQUIRE_FALSE(after.validate_against_store(chain, store).trusted);
    }

    SECTION("SCTNotAfter without any SCT")
    {
        Constraints c;
        c.sct_not_after = parse_rfc3339("2024-06-01T00:00:00Z").value();
        store.constraints.emplace(fx.root_fp, c);

        auto result = Validator(fx.registry, kNow).validate_against_store(fx.chain(), store);
        REQUIRE_FALSE(result.trusted);
        REQUIRE(result.failure_reason.find("none found") != std::string::npos);
        REQUIRE(result.failure_reason == "SCT required but none found (deadline: 2024-06-01)");
    }

    SECTION("SCTNotAfter with one SCT before the deadline")
    {
        Constraints c;
        c.sct_not_after = parse_rfc3339("2024-06-01T00:00:00Z").value();
        store.constraints.emplace(fx.root_fp, c);

        auto chain = fx.chain();
        chain.scts.push_back(SCT{parse_rfc3339("2024-06-01T00:00:00Z").value(), {}, SCTSource::Embedded});
        chain.scts.push_back(SCT{parse_rfc3339("2024-09-01T00:00:00Z").value(), {}, SCTSource::TLSExtension});

        auto result = Validator(fx.registry, kNow).validate_against_store(chain, store);
        REQUIRE(result.trusted);
    }

    SECTION("SCTNotAfter with every SCT late")
    {
        Constraints c;
        c.sct_not_after = parse_rfc3339("2024-06-01T00:00:00Z").value();
        store.constraints.emplace(fx.root_fp, c);

        auto chain = fx.chain();
        chain.scts.push_back(SCT{parse_rfc3339("2024-06-02T00:00:00Z").value(), {}, SCTSource::Embedded});

        auto result = Validator(fx.registry, kNow).validate_against_store(chain, store);
        REQUIRE_FALSE(result.trusted);
        REQUIRE(result.failure_reason == "all SCTs issued after deadline (2024-06-01)");
    }

    SECTION("SCTNotAfter with an out-of-range SCT timestamp")
    {
        Constraints c;
        c.sct_not_after = parse_rfc3339("2024-06-01T00:00:00Z").value();
        store.constraints.emplace(fx.root_fp, c);

        auto chain = fx.chain();
        chain.scts.push_back(SCT{from_unix_millis(0x0000100000000000ULL), {}, SCTSource::TLSExtension});

        auto result = Validator(fx.registry, kNow).validate_against_store(chain, store);
        REQUIRE_FALSE(result.trusted);
        REQUIRE(result.failure_reason == "all SCTs issued after deadline (2024-06-01)");
    }

    SECTION("first violation wins")
    {
        Constraints c;
        c.not_before_max = parse_rfc3339("2023-12-31T00:00:00Z").value();
        c.distrust_date = parse_rfc3339("2025-01-01T00:00:00Z").value();
        c.sct_not_after = parse_rfc3339("2024-06-01T00:00:00Z").value();
        store.constraints.emplace(fx.root_fp, c);

        auto result = Validator(fx.registry, kNow).validate_against_store(fx.chain(), store);
        REQUIRE(result.failure_reason.starts_with("certificate issued after trust cutoff"));
    }

    SECTION("constraints on other roots do not apply")
    {
        Constraints c;
        c.distrust_date = parse_rfc3339("2020-01-01T00:00:00Z").value();
        store.fingerprints.push_back(fx.other_fp);
        store.constraints.emplace(fx.other_fp, c);

        REQUIRE(Validator(fx.registry, kNow).validate_against_store(fx.chain(), store).trusted);
    }
}

TEST_CASE("Stores are validated independently", "[validator]")
{
    Fixture fx;
    auto unknown = Fingerprint::parse(std::string(64, 'D')).value();

    std::vector<Store> stores;
    for (int v = 10; v < 18; ++v)
        stores.push_back(make_store(Platform::Android, std::to_string(v), {fx.root_fp}));
    stores[3] = make_store(Platform::Android, "13", {unknown});

    Validator validator(fx.registry, kNow);
    auto results = validator.validate_chain(fx.chain(), stores);
    REQUIRE(results.size() == stores.size());
    for (size_t i = 0; i < results.size(); ++i)
    {
        REQUIRE(results[i].platform == stores[i].platform_version());
        if (i == 3)
        {
            REQUIRE_FALSE(results[i].trusted);
            REQUIRE(results[i].failure_reason == "no valid root certificates in trust store");
        }
        else
        {
            REQUIRE(results[i].trusted);
        }
    }

    REQUIRE(validator.validate_chain(fx.chain(), {}).empty());
}

TEST_CASE("Every store gets a result with hundreds of stores", "[validator]")
{
    Fixture fx;
    std::vector<Store> stores;
    for (int v = 0; v < 400; ++v)
        stores.push_back(make_store(Platform::Chrome, std::to_string(v), {fx.root_fp}));

    auto results = Validator(fx.registry, kNow).validate_chain(fx.chain(), stores);
    REQUIRE(results.size() == stores.size());
    for (size_t i = 0; i < results.size(); ++i)
    {
        REQUIRE(results[i].platform == stores[i].platform_version());
        REQUIRE(results[i].trusted);
    }
}

TEST_CASE("Path validity and distrust use the same instant", "[validator]")
{
    Fixture fx;
    auto store = make_store(Platform::MacOS, "14", {fx.root_fp});
    Constraints c;
    c.distrust_date = parse_rfc3339("2025-01-01T00:00:00Z").value();
    store.constraints.emplace(fx.root_fp, c);

    // first reading is before the distrust date, any later reading is after it
    int calls = 0;
    Clock stepping = [&calls] {
        return parse_rfc3339(calls++ == 0 ? "2024-12-31T00:00:00Z" : "2025-06-01T00:00:00Z").value();
    };

    auto result = Validator(fx.registry, stepping).validate_against_store(fx.chain(), store);
    REQUIRE(calls == 1);
    REQUIRE(result.trusted);
}

TEST_CASE("validate applies the filter first", "[validator]")
{
    Fixture fx;
    std::vector<Store> stores{
        make_store(Platform::IOS, "17", {fx.root_fp}),
        make_store(Platform::Android, "14", {fx.other_fp})};
    TrustStoreSnapshot snapshot(stores, fx.registry);
    auto chain = fx.chain();

    SECTION("no filter selects every store")
    {
        auto results = validate(chain, snapshot, std::nullopt, kNow);
        REQUIRE(results.has_value());
        REQUIRE(results->size() == 2);
    }

    SECTION("filter narrows the selection")
    {
        auto results = validate(chain, snapshot, std::string("ios>=16"), kNow);
        REQUIRE(results.has_value());
        REQUIRE(results->size() == 1);
        REQUIRE((*results)[0].trusted);
    }

    SECTION("empty filter expression is an error")
    {
        auto results = validate(chain, snapshot, std::string(""), kNow);
        REQUIRE_FALSE(results.has_value());
        REQUIRE(results.error().code == ErrorCode::FilterError);
    }

    SECTION("nothing selected is an error")
    {
        auto results = validate(chain, snapshot, std::string("windows"), kNow);
        REQUIRE_FALSE(results.has_value());
        REQUIRE(results.error().code == ErrorCode::NoStoresSelected);
        REQUIRE(std::string(results.error().what()) == "no trust stores match filter");
    }
}

TEST_CASE("sort_results orders by platform then version", "[validator]")
{
    auto result = [](Platform p, std::string v) {
        TrustResult r;
        r.platform = PlatformVersion{p, std::move(v)};
        return r;
    };
    std::vector<TrustResult> results{
        result(Platform::IOS, "17"),
        result(Platform::Chrome, "current"),
        result(Platform::Android, "9"),
        result(Platform::IOS, "9"),
        result(Platform::Chrome, "139"),
        result(Platform::Android, "14")};

    sort_results(results);
    std::vector<std::string> order;
    for (const auto &r : results)
        order.push_back(to_string(r.platform));
    REQUIRE(order == std::vector<std::string>{
                         "android/9", "android/14", "chrome/139", "chrome/current", "ios/9", "ios/17"});
}

TEST_CASE("classify_verify_error", "[validator]")
{
    REQUIRE(classify_verify_error(X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT_LOCALLY, "h", "") ==
            "certificate signed by unknown authority");
    REQUIRE(classify_verify_error(X509_V_ERR_HOSTNAME_MISMATCH, "example.test", "") ==
            "certificate is not valid for example.test");
    REQUIRE(classify_verify_error(X509_V_ERR_CERT_REVOKED, "h", "certificate revoked") == "certificate revoked");
}
