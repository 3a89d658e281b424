#include <catch2/catch.hpp>
#include <bmr/cache.hpp>
#include <bmr/lock.hpp>
#include "fixtures.hpp"

#include <cstdlib>
#include <iterator>
#include <thread>

using namespace bmr;

namespace {

RemoteSpec spec_of(const std::string& s) {
    auto r = RemoteSpec::parse(s);
    REQUIRE(r.is_ok());
    return r.value();
}

CacheOptions options_for(const GitFixture& fx) {
    CacheOptions opts;
    opts.root = fx.td.str("cache");
    opts.mirrors[GitFixture::mirror_prefix()] = fx.mirror_target();
    return opts;
}

// Make the next resolve consider the entry stale
void force_stale(const std::string& clone_dir) {
    auto entry = CacheEntry::read(clone_dir);
    REQUIRE(entry.is_ok());
    entry.value().last_fetched_at = 0;
    REQUIRE(entry.value().write(clone_dir).is_ok());
}

std::string read_text(const fs::path& p) {
    std::ifstream in(p);
    return std::string((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
}

} // namespace

// ===== Sidecar =====

TEST_CASE("cache sidecar write and read", "[cache]") {
    TempDir td;
    CacheEntry e;
    e.source = "git+https://github.com/acme/pack.git#main";
    e.host = "github.com";
    e.org = "acme";
    e.repo = "pack";
    e.ref = "main";
    e.commit = "0123456789abcdef0123456789abcdef01234567";
    e.last_fetched_at = 1700000000;
    e.last_validated_at = 1700000100;
    e.size_on_disk = 4096;
    REQUIRE(e.write(td.str()).is_ok());

    std::string text = read_text(td.path / CacheEntry::kSidecarName);
    REQUIRE(text.rfind("# Managed by bmr", 0) == 0);

    auto r = CacheEntry::read(td.str());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().source == e.source);
    REQUIRE(r.value().protocol == GitProtocol::Https);
    REQUIRE(r.value().ref == "main");
    REQUIRE(r.value().commit == e.commit);
    REQUIRE(r.value().last_fetched_at == 1700000000);
    REQUIRE(r.value().last_validated_at == 1700000100);
    REQUIRE(r.value().size_on_disk == 4096);
    REQUIRE(r.value().local_path == td.str());
    REQUIRE(r.value().matches(spec_of("git+https://github.com/acme/pack.git#main")));
    REQUIRE_FALSE(r.value().matches(spec_of("git+https://github.com/acme/pack.git")));
}

TEST_CASE("cache sidecar missing or garbled is corrupt", "[cache]") {
    TempDir td;
    auto missing = CacheEntry::read(td.str());
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == BmrError::CacheCorrupt);

    td.write_file(CacheEntry::kSidecarName, "source = [unclosed\n");
    auto garbled = CacheEntry::read(td.str());
    REQUIRE(garbled.is_err());
    REQUIRE(garbled.error().code == BmrError::CacheCorrupt);

    td.write_file(CacheEntry::kSidecarName, "source = \"x\"\n");
    auto partial = CacheEntry::read(td.str());
    REQUIRE(partial.is_err());
    REQUIRE(partial.error().code == BmrError::CacheCorrupt);
}

TEST_CASE("cache paths derive from the key", "[cache]") {
    CacheOptions opts;
    opts.root = "/var/cache/bmr";
    GitCacheManager mgr(opts);
    auto spec = spec_of("git+https://github.com/acme/pack.git#main:/bmad");
    REQUIRE(mgr.entry_path(spec) == "/var/cache/bmr/github.com-acme-pack-main");
    REQUIRE(mgr.lock_path(spec) == "/var/cache/bmr/.locks/github.com-acme-pack-main.lock");
}

// ===== Resolve =====

TEST_CASE("cache first resolve clones", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    std::string upstream = fx.create_v6_repo("acme", "pack");
    GitCacheManager mgr(options_for(fx));

    auto r = mgr.resolve(spec_of("git+https://example.org/acme/pack.git#main"));
    REQUIRE(r.is_ok());
    const auto& res = r.value();
    REQUIRE(res.action == CacheAction::Cloned);
    REQUIRE(res.local_path == fx.td.str("cache/example.org-acme-pack-main"));
    REQUIRE(res.content_path == res.local_path);
    REQUIRE(res.entry.commit == GitFixture::head(upstream));
    REQUIRE(res.entry.size_on_disk > 0);
    REQUIRE(res.warnings.empty());

    REQUIRE(fs::exists(fs::path(res.local_path) / "bmad" / "_cfg" / "manifest.yaml"));
    REQUIRE(fs::exists(fs::path(res.local_path) / CacheEntry::kSidecarName));
    std::string exclude = read_text(fs::path(res.local_path) / ".git" / "info" / "exclude");
    REQUIRE(exclude.find("/.bmr-cache.toml") != std::string::npos);

    // No leftovers from the temporary clone
    std::error_code ec;
    REQUIRE(fs::is_empty(fx.td.path / "cache" / ".tmp", ec));
}

TEST_CASE("cache second resolve reuses without changes", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    fx.create_v6_repo("acme", "pack");
    GitCacheManager mgr(options_for(fx));
    auto spec = spec_of("git+https://example.org/acme/pack.git#main");

    auto first = mgr.resolve(spec);
    REQUIRE(first.is_ok());
    auto second = mgr.resolve(spec);
    REQUIRE(second.is_ok());

    REQUIRE(second.value().action == CacheAction::Reused);
    REQUIRE(second.value().local_path == first.value().local_path);
    REQUIRE(second.value().entry.commit == first.value().entry.commit);
    REQUIRE(second.value().entry.last_fetched_at == first.value().entry.last_fetched_at);
}

TEST_CASE("cache within TTL does not fetch", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    std::string upstream = fx.create_v6_repo("acme", "pack");
    GitCacheManager mgr(options_for(fx));
    auto spec = spec_of("git+https://example.org/acme/pack.git#main");

    auto first = mgr.resolve(spec);
    REQUIRE(first.is_ok());
    fx.write(upstream, "bmad/bmm/agents/remote-agent.md", "# remote agent v2\n");
    fx.commit(upstream, "second");

    auto second = mgr.resolve(spec);
    REQUIRE(second.is_ok());
    REQUIRE(second.value().action == CacheAction::Reused);
    REQUIRE(second.value().entry.commit == first.value().entry.commit);
}

TEST_CASE("cache stale entry fast-forwards", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    std::string upstream = fx.create_v6_repo("acme", "pack");
    GitCacheManager mgr(options_for(fx));
    auto spec = spec_of("git+https://example.org/acme/pack.git#main");

    auto first = mgr.resolve(spec);
    REQUIRE(first.is_ok());
    fx.write(upstream, "bmad/bmm/agents/remote-agent.md", "# remote agent v2\n");
    std::string second_commit = fx.commit(upstream, "second");

    force_stale(first.value().local_path);
    auto updated = mgr.resolve(spec);
    REQUIRE(updated.is_ok());
    REQUIRE(updated.value().action == CacheAction::Updated);
    REQUIRE(updated.value().entry.commit == second_commit);
    REQUIRE(updated.value().entry.last_fetched_at > 0);
    REQUIRE(read_text(fs::path(updated.value().local_path) / "bmad/bmm/agents/remote-agent.md")
            == "# remote agent v2\n");

    // Stale again with nothing new upstream: fetched but not updated
    force_stale(first.value().local_path);
    auto unchanged = mgr.resolve(spec);
    REQUIRE(unchanged.is_ok());
    REQUIRE(unchanged.value().action == CacheAction::Reused);
    REQUIRE(unchanged.value().entry.commit == second_commit);
    REQUIRE(unchanged.value().entry.last_fetched_at > 0);
}

TEST_CASE("cache default branch entry follows remote HEAD", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    std::string upstream = fx.create_v6_repo("acme", "pack");
    GitCacheManager mgr(options_for(fx));
    auto spec = spec_of("git+https://example.org/acme/pack.git");

    auto first = mgr.resolve(spec);
    REQUIRE(first.is_ok());
    REQUIRE(first.value().local_path == fx.td.str("cache/example.org-acme-pack-HEAD"));
    REQUIRE(first.value().entry.ref.empty());

    fx.write(upstream, "new.txt", "new\n");
    std::string second_commit = fx.commit(upstream, "second");
    force_stale(first.value().local_path);

    auto second = mgr.resolve(spec);
    REQUIRE(second.is_ok());
    REQUIRE(second.value().action == CacheAction::Updated);
    REQUIRE(second.value().entry.commit == second_commit);
}

TEST_CASE("cache explicit HEAD ref reuses the default branch clone", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    fx.create_v6_repo("acme", "pack");
    GitCacheManager mgr(options_for(fx));

    auto plain = mgr.resolve(spec_of("git+https://example.org/acme/pack.git"));
    REQUIRE(plain.is_ok());
    REQUIRE(plain.value().action == CacheAction::Cloned);

    auto head = mgr.resolve(spec_of("git+https://example.org/acme/pack.git#HEAD"));
    REQUIRE(head.is_ok());
    REQUIRE(head.value().action == CacheAction::Reused);
    REQUIRE(head.value().local_path == plain.value().local_path);
    REQUIRE(head.value().entry.commit == plain.value().entry.commit);
}

TEST_CASE("cache explicit HEAD ref clones the default branch", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    std::string upstream = fx.create_v6_repo("acme", "pack");
    GitCacheManager mgr(options_for(fx));

    auto r = mgr.resolve(spec_of("git+https://example.org/acme/pack.git#HEAD"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().action == CacheAction::Cloned);
    REQUIRE(r.value().local_path == fx.td.str("cache/example.org-acme-pack-HEAD"));
    REQUIRE(r.value().entry.commit == GitFixture::head(upstream));
}

TEST_CASE("cache auto_update off never fetches", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    std::string upstream = fx.create_v6_repo("acme", "pack");
    auto opts = options_for(fx);
    opts.auto_update = false;
    GitCacheManager mgr(opts);
    auto spec = spec_of("git+https://example.org/acme/pack.git#main");

    auto first = mgr.resolve(spec);
    REQUIRE(first.is_ok());
    fx.write(upstream, "new.txt", "new\n");
    fx.commit(upstream, "second");
    force_stale(first.value().local_path);

    auto second = mgr.resolve(spec);
    REQUIRE(second.is_ok());
    REQUIRE(second.value().action == CacheAction::Reused);
    REQUIRE(second.value().entry.commit == first.value().entry.commit);
}

TEST_CASE("cache commit refs are never fetched", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    std::string upstream = fx.create_v6_repo("acme", "pack");
    std::string pinned = GitFixture::head(upstream);
    GitCacheManager mgr(options_for(fx));
    auto spec = spec_of("git+https://example.org/acme/pack.git#" + pinned);
    REQUIRE(spec.ref_is_commit());

    auto first = mgr.resolve(spec);
    REQUIRE(first.is_ok());
    REQUIRE(first.value().entry.commit == pinned);

    fx.write(upstream, "new.txt", "new\n");
    fx.commit(upstream, "second");
    force_stale(first.value().local_path);

    auto second = mgr.resolve(spec);
    REQUIRE(second.is_ok());
    REQUIRE(second.value().action == CacheAction::Reused);
    REQUIRE(second.value().entry.commit == pinned);
    REQUIRE(second.value().warnings.empty());
}

TEST_CASE("cache different refs get different clones", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    std::string upstream = fx.create_v6_repo("acme", "pack");
    GitFixture::git(upstream, {"tag", "v1"});
    GitFixture::git(upstream, {"branch", "next"});
    GitCacheManager mgr(options_for(fx));

    auto main_r = mgr.resolve(spec_of("git+https://example.org/acme/pack.git#main"));
    auto tag_r = mgr.resolve(spec_of("git+https://example.org/acme/pack.git#v1"));
    auto next_r = mgr.resolve(spec_of("git+https://example.org/acme/pack.git#next"));
    REQUIRE(main_r.is_ok());
    REQUIRE(tag_r.is_ok());
    REQUIRE(next_r.is_ok());

    REQUIRE(main_r.value().local_path != tag_r.value().local_path);
    REQUIRE(main_r.value().local_path != next_r.value().local_path);
    REQUIRE(tag_r.value().action == CacheAction::Cloned);
    REQUIRE(next_r.value().action == CacheAction::Cloned);

    auto listed = mgr.list();
    REQUIRE(listed.is_ok());
    REQUIRE(listed.value().size() == 3);
}

TEST_CASE("cache subpath only affects content path", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    fx.create_v6_repo("acme", "pack");
    GitCacheManager mgr(options_for(fx));

    auto whole = mgr.resolve(spec_of("git+https://example.org/acme/pack.git#main"));
    auto sub = mgr.resolve(spec_of("git+https://example.org/acme/pack.git#main:/bmad"));
    REQUIRE(whole.is_ok());
    REQUIRE(sub.is_ok());
    REQUIRE(sub.value().action == CacheAction::Reused);
    REQUIRE(sub.value().local_path == whole.value().local_path);
    REQUIRE(sub.value().content_path == whole.value().local_path + "/bmad");
}

TEST_CASE("cache garbled sidecar re-clones", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    fx.create_v6_repo("acme", "pack");
    GitCacheManager mgr(options_for(fx));
    auto spec = spec_of("git+https://example.org/acme/pack.git#main");

    auto first = mgr.resolve(spec);
    REQUIRE(first.is_ok());
    {
        std::ofstream out(fs::path(first.value().local_path) / CacheEntry::kSidecarName);
        out << "this is = = not toml\n";
    }

    auto second = mgr.resolve(spec);
    REQUIRE(second.is_ok());
    REQUIRE(second.value().action == CacheAction::Recloned);
    REQUIRE_FALSE(second.value().warnings.empty());
    REQUIRE(CacheEntry::read(second.value().local_path).is_ok());
}

TEST_CASE("cache entry without git directory re-clones", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    fx.create_v6_repo("acme", "pack");
    GitCacheManager mgr(options_for(fx));
    auto spec = spec_of("git+https://example.org/acme/pack.git#main");

    auto first = mgr.resolve(spec);
    REQUIRE(first.is_ok());
    fs::remove_all(fs::path(first.value().local_path) / ".git");

    auto second = mgr.resolve(spec);
    REQUIRE(second.is_ok());
    REQUIRE(second.value().action == CacheAction::Recloned);
    REQUIRE(fs::exists(fs::path(second.value().local_path) / ".git"));
}

TEST_CASE("cache sidecar for another source re-clones", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    fx.create_v6_repo("acme", "pack");
    GitCacheManager mgr(options_for(fx));
    auto spec = spec_of("git+https://example.org/acme/pack.git#main");

    auto first = mgr.resolve(spec);
    REQUIRE(first.is_ok());
    auto entry = CacheEntry::read(first.value().local_path);
    REQUIRE(entry.is_ok());
    entry.value().repo = "other";
    REQUIRE(entry.value().write(first.value().local_path).is_ok());

    auto second = mgr.resolve(spec);
    REQUIRE(second.is_ok());
    REQUIRE(second.value().action == CacheAction::Recloned);
    REQUIRE(second.value().entry.repo == "pack");
}

TEST_CASE("cache serves stale clone when update fails", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    fx.create_v6_repo("acme", "pack");
    GitCacheManager mgr(options_for(fx));
    auto spec = spec_of("git+https://example.org/acme/pack.git#main");

    auto first = mgr.resolve(spec);
    REQUIRE(first.is_ok());
    std::string path = first.value().local_path;

    // Upstream disappears
    fs::remove_all(fx.repo_dir("acme", "pack"));
    force_stale(path);

    auto second = mgr.resolve(spec);
    REQUIRE(second.is_ok());
    REQUIRE(second.value().action == CacheAction::Reused);
    REQUIRE(second.value().entry.commit == first.value().entry.commit);
    REQUIRE(second.value().warnings.size() == 1);
    REQUIRE(second.value().warnings[0].find("update of") != std::string::npos);
    REQUIRE(fs::exists(fs::path(path) / "bmad" / "_cfg" / "manifest.yaml"));

    // The failed attempt does not count as a fetch
    auto persisted = CacheEntry::read(path);
    REQUIRE(persisted.is_ok());
    REQUIRE(persisted.value().last_fetched_at == 0);
}

TEST_CASE("cache missing repository is CloneFailed", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    GitCacheManager mgr(options_for(fx));
    auto spec = spec_of("git+https://example.org/acme/absent.git#main");

    auto r = mgr.resolve(spec);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == BmrError::CloneFailed);
    REQUIRE_FALSE(fs::exists(mgr.entry_path(spec)));
}

TEST_CASE("cache concurrent resolves clone once", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    fx.create_v6_repo("acme", "pack");
    auto spec = spec_of("git+https://example.org/acme/pack.git#main");

    std::vector<CacheAction> actions(2);
    std::vector<std::string> paths(2);
    std::vector<std::string> commits(2);
    std::vector<int> ok(2, 0);
    std::vector<std::thread> threads;
    for (int i = 0; i < 2; ++i) {
        threads.emplace_back([&, i]() {
            GitCacheManager mgr(options_for(fx));
            auto r = mgr.resolve(spec);
            ok[i] = r.is_ok() ? 1 : 0;
            if (r.is_ok()) {
                actions[i] = r.value().action;
                paths[i] = r.value().local_path;
                commits[i] = r.value().entry.commit;
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(ok[0] == 1);
    REQUIRE(ok[1] == 1);
    int cloned = 0;
    for (auto a : actions) {
        if (a == CacheAction::Cloned) ++cloned;
    }
    REQUIRE(cloned == 1);
    REQUIRE(paths[0] == paths[1]);
    REQUIRE(paths[0] == fx.td.str("cache/example.org-acme-pack-main"));
    REQUIRE(commits[0] == commits[1]);
}

TEST_CASE("cache lock wait is bounded by the timeout", "[cache]") {
    TempDir td;
    CacheOptions opts;
    opts.root = td.str("cache");
    opts.timeout_seconds = 1;
    GitCacheManager mgr(opts);
    auto spec = spec_of("git+https://example.org/acme/pack.git#main");

    auto held = KeyLock::acquire(mgr.lock_path(spec));
    REQUIRE(held.is_ok());

    auto start = std::chrono::steady_clock::now();
    auto r = mgr.resolve(spec);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == BmrError::CloneFailed);
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
    REQUIRE(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count() < 5);
    REQUIRE_FALSE(fs::exists(mgr.entry_path(spec)));

    auto ev = mgr.evict(spec);
    REQUIRE(ev.is_err());
    REQUIRE(ev.error().message.find("timed out") != std::string::npos);
}

TEST_CASE("cache removes leftover temporary clones of its key", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    fx.create_v6_repo("acme", "pack");
    GitCacheManager mgr(options_for(fx));
    auto spec = spec_of("git+https://example.org/acme/pack.git#main");
    std::string key = derive_cache_key(spec);

    fx.td.write_file("cache/.tmp/" + key + "+4242.0/bmad/junk.md", "half a clone\n");
    fx.td.write_file("cache/.tmp/" + key + "+old+4242.1/README.md", "replaced\n");
    // A key that merely starts with the same text belongs to another lock
    std::string other = derive_cache_key(spec_of("git+https://example.org/acme/pack.git#main.2"));
    REQUIRE(other.rfind(key, 0) == 0);
    fx.td.write_file("cache/.tmp/" + other + "+4242.2/README.md", "in flight\n");

    auto r = mgr.resolve(spec);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().action == CacheAction::Cloned);
    REQUIRE_FALSE(fs::exists(fx.td.path / "cache" / ".tmp" / (key + "+4242.0")));
    REQUIRE_FALSE(fs::exists(fx.td.path / "cache" / ".tmp" / (key + "+old+4242.1")));
    REQUIRE(fs::exists(fx.td.path / "cache" / ".tmp" / (other + "+4242.2")));
}

TEST_CASE("cache without a usable git is CloneFailed with a hint", "[cache]") {
    TempDir td;
    td.make_dir("empty-bin");
    CacheOptions opts;
    opts.root = td.str("cache");
    GitCacheManager mgr(opts);
    auto spec = spec_of("git+https://example.org/acme/pack.git#main");

    const char* old_path = std::getenv("PATH");
    std::string saved = old_path ? old_path : "";
    setenv("PATH", td.str("empty-bin").c_str(), 1);
    auto r = mgr.resolve(spec);
    setenv("PATH", saved.c_str(), 1);

    REQUIRE(r.is_err());
    REQUIRE(r.error().code == BmrError::CloneFailed);
    REQUIRE(r.error().message.find("git is not usable") != std::string::npos);
    REQUIRE(r.error().hint.find("git") != std::string::npos);
    REQUIRE_FALSE(fs::exists(mgr.entry_path(spec)));
}

TEST_CASE("cache list evict and clean_all", "[cache]") {
    REQUIRE_GIT();
    GitFixture fx;
    fx.create_v6_repo("acme", "pack");
    fx.create_v6_repo("acme", "extra");
    GitCacheManager mgr(options_for(fx));
    auto pack = spec_of("git+https://example.org/acme/pack.git#main");
    auto extra = spec_of("git+https://example.org/acme/extra.git#main");

    REQUIRE(mgr.resolve(pack).is_ok());
    REQUIRE(mgr.resolve(extra).is_ok());

    auto listed = mgr.list();
    REQUIRE(listed.is_ok());
    REQUIRE(listed.value().size() == 2);
    REQUIRE(listed.value()[0].repo == "extra");
    REQUIRE(listed.value()[1].repo == "pack");

    REQUIRE(mgr.evict(pack).is_ok());
    REQUIRE_FALSE(fs::exists(mgr.entry_path(pack)));
    REQUIRE(mgr.list().value().size() == 1);

    REQUIRE(mgr.clean_all().is_ok());
    REQUIRE_FALSE(fs::exists(mgr.cache_root()));
    REQUIRE(mgr.list().value().empty());
}
