// Core unit tests without external framework (run via CTest).
#include "openzone/AppState.hpp"
#include "openzone/Interaction.hpp"
#include "openzone/MockZoneGateway.hpp"
#include "openzone/RecordForm.hpp"

#include <cstdlib>
#include <deque>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using openzone::GatewayError;
using openzone::LoadState;
using openzone::MutationPayload;
using openzone::NodeKind;
using openzone::Severity;
using openzone::TreeNode;
using Op = openzone::MockZoneGateway::Op;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

// Jobs wait until the test resolves them; commits wait until delivered. This
// lets a test reorder network completions at will.
class ManualTaskRunner : public openzone::TaskRunner {
public:
    void post(Job job) override { jobs_.push_back(std::move(job)); }

    std::size_t pendingJobs() const { return jobs_.size(); }

    std::size_t pendingCommits() const { return commits_.size(); }

    // Runs the round-trip of job i; its commit is held back. After stop()
    // jobs still run (with their stop check raised) but commits are dropped.
    void resolve(std::size_t i) {
        Job job = std::move(jobs_[i]);
        jobs_.erase(jobs_.begin() + static_cast<std::ptrdiff_t>(i));
        Commit c = job([this] { return stopping_; });
        if (c && !stopping_)
            commits_.push_back(std::move(c));
    }

    void deliver() {
        std::deque<Commit> ready;
        ready.swap(commits_);
        for (auto &c : ready)
            c();
    }

    // Runs the held commit at index i only.
    void deliverAt(std::size_t i) {
        Commit c = std::move(commits_[i]);
        commits_.erase(commits_.begin() + static_cast<std::ptrdiff_t>(i));
        c();
    }

    void stop() { stopping_ = true; }

    // Everything, including work posted by commits.
    void drain() {
        while (!jobs_.empty() || !commits_.empty()) {
            while (!jobs_.empty())
                resolve(0);
            deliver();
        }
    }

private:
    std::deque<Job> jobs_;
    std::deque<Commit> commits_;
    bool stopping_ = false;
};

struct RecordingSink : openzone::NotificationSink {
    struct Note {
        std::string title;
        std::string message;
        Severity severity;
    };
    std::vector<Note> notes;

    void notify(const std::string &title, const std::string &message,
                Severity severity) override {
        notes.push_back({title, message, severity});
    }

    int count(Severity s) const {
        int n = 0;
        for (const auto &note : notes)
            n += note.severity == s ? 1 : 0;
        return n;
    }
};

struct FakeModalHost : openzone::ModalHost {
    std::vector<std::string> confirmLabels;
    std::optional<openzone::Interaction<bool>> confirmReply;
    std::optional<openzone::EditRequest> lastEdit;
    std::optional<openzone::Interaction<MutationPayload>> editReply;

    void confirmDelete(const std::string &recordLabel,
                       openzone::Interaction<bool> reply) override {
        confirmLabels.push_back(recordLabel);
        confirmReply = reply;
    }

    void editRecord(const openzone::EditRequest &request,
                    openzone::Interaction<MutationPayload> reply) override {
        lastEdit = request;
        editReply = reply;
    }
};

struct Fixture {
    RecordingSink sink;
    FakeModalHost host;
    openzone::MockZoneGateway *gw;
    ManualTaskRunner *runner;
    openzone::AppState app;

    Fixture()
        : gw(new openzone::MockZoneGateway()), runner(new ManualTaskRunner()),
          app(std::unique_ptr<openzone::ZoneGateway>(gw),
              std::unique_ptr<openzone::TaskRunner>(runner), sink, host) {
        gw->clear();
    }

    TreeNode *zone(const std::string &id) const {
        return app.store.findParent(id);
    }
};

// example.com with a single apex A record; example.org with two records;
// empty.test without records.
void seedExample(Fixture &f) {
    f.gw->addZone({"z1", "example.com", "active"});
    f.gw->addZone({"z2", "example.org", "active"});
    f.gw->addZone({"z3", "empty.test", "active"});
    f.gw->addRecord({"r1", "z1", "example.com", "A", "1.1.1.1", 1, true});
    f.gw->addRecord({"r2", "z2", "www.example.org", "CNAME", "example.org",
                     1, false});
    f.gw->addRecord({"r3", "z2", "example.org", "MX", "mx.example.org",
                     3600, false});
}

void loadAll(Fixture &f) {
    f.app.controller.loadRoot();
    f.runner->drain();
}

void test_load_root_seeds_placeholders(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);

    TreeNode *root = f.app.store.root();
    t.check(root->childCount() == 3, "loadRoot should install one node per zone");
    for (std::size_t i = 0; i < root->childCount(); ++i) {
        TreeNode *p = root->child(i);
        t.check(p->kind() == NodeKind::ParentNode,
                "root children should be parent nodes");
        t.check(p->loadState() == LoadState::Unloaded,
                "fresh parents should be Unloaded");
        t.check(p->childCount() == 1 &&
                    p->child(0)->kind() == NodeKind::PlaceholderLeaf,
                "fresh parents should hold exactly one placeholder");
        t.check(p->child(0)->parent() == p,
                "placeholder should point back to its parent");
    }
    t.check(f.zone("z1") && f.zone("z1")->zone() &&
                f.zone("z1")->zone()->name == "example.com",
            "parent payload should carry the zone");
}

void test_load_root_failure_keeps_children(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);

    f.gw->failNext(Op::ListParents, GatewayError::transport("timed out"));
    f.app.controller.loadRoot();
    f.runner->drain();
    t.check(f.app.store.root()->childCount() == 3,
            "failed root load should leave previous zones in place");
    t.check(f.sink.count(Severity::Error) == 1,
            "failed root load should notify an error");
    t.check(!f.app.controller.rootLoading(),
            "root load flag should clear after failure");
}

void test_load_root_reentrant_ignored(TestContext &t) {
    Fixture f;
    seedExample(f);
    f.app.controller.loadRoot();
    f.app.controller.loadRoot();
    t.check(f.runner->pendingJobs() == 1,
            "second loadRoot while pending should be ignored");
    f.runner->drain();
    t.check(f.gw->callCount(Op::ListParents) == 1,
            "only one zone listing should reach the gateway");
}

void test_load_children_counts_and_labels(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);

    TreeNode *z2 = f.zone("z2");
    t.check(f.app.controller.loadChildren(z2), "loadChildren should start");
    t.check(z2->loadState() == LoadState::Loading,
            "parent should be Loading while the request is pending");
    t.check(z2->childCount() == 0,
            "placeholder should be cleared when loading starts");
    f.runner->drain();

    t.check(z2->loadState() == LoadState::Loaded, "parent should be Loaded");
    t.check(z2->childCount() == 2, "child count should match the listing");
    bool anyPlaceholder = false;
    for (std::size_t i = 0; i < z2->childCount(); ++i)
        anyPlaceholder |= z2->child(i)->kind() == NodeKind::PlaceholderLeaf;
    t.check(!anyPlaceholder, "no placeholder should survive a load");

    TreeNode *cname = f.app.store.findChild("z2", "r2");
    TreeNode *mx = f.app.store.findChild("z2", "r3");
    t.check(cname && mx, "records should be addressable by id");
    if (cname && mx) {
        t.checkContains(cname->label(), "CNAME", "label should show the type");
        t.checkContains(cname->label(), "www.example.org",
                        "label should show the name");
        t.checkContains(cname->label(), "dns only",
                        "proxiable types should show routing status");
        t.checkContains(mx->label(), "ttl 3600",
                        "other types should show the raw TTL");
        t.check(f.app.store.findContainingParent(mx) == z2,
                "containing parent of a record should be its zone");
    }
}

void test_load_children_empty_installs_info_leaf(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);

    TreeNode *z3 = f.zone("z3");
    f.app.controller.loadChildren(z3);
    f.runner->drain();
    t.check(z3->loadState() == LoadState::Loaded,
            "empty listing should still be Loaded");
    t.check(z3->childCount() == 1 &&
                z3->child(0)->kind() == NodeKind::InfoLeaf,
            "empty listing should install one informational leaf");
}

void test_load_children_reentrant_ignored(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);

    TreeNode *z1 = f.zone("z1");
    t.check(f.app.controller.loadChildren(z1), "first load should start");
    t.check(!f.app.controller.loadChildren(z1),
            "second load while Loading should be ignored");
    t.check(f.app.controller.activate(z1) ==
                openzone::TreeController::Activation::Ignored,
            "activating a loading parent should be ignored");
    t.check(f.runner->pendingJobs() == 1, "only one job should be pending");

    // Another zone loads independently.
    t.check(f.app.controller.loadChildren(f.zone("z2")),
            "loads of different zones should not block each other");
    f.runner->drain();
    t.check(f.gw->callCount(Op::ListChildren) == 2,
            "exactly two record listings should reach the gateway");
}

void test_load_children_failure_and_reset(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);

    TreeNode *z1 = f.zone("z1");
    f.gw->failNext(Op::ListChildren,
                   GatewayError::remote("Invalid zone identifier", 400));
    f.app.controller.loadChildren(z1);
    f.runner->drain();

    t.check(z1->loadState() == LoadState::Failed, "parent should be Failed");
    t.check(z1->childCount() == 1 &&
                z1->child(0)->kind() == NodeKind::ErrorLeaf,
            "failure should install a single error leaf");
    if (z1->childCount() == 1) {
        t.checkContains(z1->child(0)->label(), "Invalid zone identifier",
                        "error leaf should carry the error text");
        t.checkContains(z1->child(0)->label(), "400",
                        "error leaf should carry the status code");
    }
    t.check(f.sink.count(Severity::Error) == 1,
            "failure should also notify");

    t.check(f.app.controller.resetParent(z1), "reset should be accepted");
    t.check(z1->loadState() == LoadState::Unloaded,
            "reset should return the parent to Unloaded");
    t.check(z1->childCount() == 1 &&
                z1->child(0)->kind() == NodeKind::PlaceholderLeaf,
            "reset should reinstall the placeholder");

    f.app.controller.loadChildren(z1);
    f.runner->drain();
    t.check(z1->loadState() == LoadState::Loaded && z1->childCount() == 1 &&
                z1->child(0)->kind() == NodeKind::ChildNode,
            "retry after reset should load the records");
}

void test_stale_children_load_discarded_after_root_refresh(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);

    f.app.controller.loadChildren(f.zone("z1"));
    f.app.controller.loadRoot();
    f.runner->resolve(1); // zone listing answers first
    f.runner->deliver();  // z1 is rebuilt
    f.runner->resolve(0); // the old record listing arrives late
    f.runner->deliver();

    t.check(f.gw->canceledCount(Op::ListChildren) == 1,
            "root refresh should cancel the running record listing");

    TreeNode *z1 = f.zone("z1");
    t.check(z1 != nullptr, "zone should exist after root refresh");
    if (z1) {
        t.check(z1->loadState() == LoadState::Unloaded,
                "rebuilt zone should not adopt a stale listing");
        t.check(z1->childCount() == 1 &&
                    z1->child(0)->kind() == NodeKind::PlaceholderLeaf,
                "rebuilt zone should keep its placeholder");
    }
}

void test_reload_cancels_pending_listing(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);

    TreeNode *z1 = f.zone("z1");
    f.app.controller.loadChildren(z1);
    t.check(f.app.controller.reloadParent("z1"),
            "reload should start even while the zone is Loading");
    t.check(f.runner->pendingJobs() == 2, "reload should post a new listing");

    f.runner->resolve(0); // the older listing
    t.check(f.gw->canceledCount(Op::ListChildren) == 1,
            "older listing should see its cancel flag raised");
    f.runner->deliver();
    t.check(z1->loadState() == LoadState::Loading,
            "canceled listing should not settle the zone");

    f.runner->drain();
    t.check(z1->loadState() == LoadState::Loaded && z1->childCount() == 1 &&
                z1->child(0)->kind() == NodeKind::ChildNode,
            "newer listing should install the records");
    t.check(!f.app.controller.reloadParent("nope"),
            "reload of an unknown zone should be refused");
}

struct CountingObserver : openzone::TreeObserver {
    std::vector<std::string> events;
    void childrenAboutToBeRemoved(const TreeNode &, std::size_t n) override {
        events.push_back("remove:" + std::to_string(n));
    }
    void childrenRemoved(const TreeNode &) override {
        events.push_back("removed");
    }
    void childrenAboutToBeInserted(const TreeNode &, std::size_t n) override {
        events.push_back("insert:" + std::to_string(n));
    }
    void childrenInserted(const TreeNode &) override {
        events.push_back("inserted");
    }
    void nodeChanged(const TreeNode &) override { events.push_back("changed"); }
};

void test_replace_children_notifies_in_one_step(TestContext &t) {
    openzone::TreeStore store;
    CountingObserver obs;
    store.setObserver(&obs);

    std::vector<std::unique_ptr<TreeNode>> zones;
    zones.push_back(openzone::TreeStore::makeParent({"a", "a.test", ""}));
    zones.push_back(openzone::TreeStore::makeParent({"b", "b.test", ""}));
    store.replaceChildren(store.root(), std::move(zones));

    std::vector<std::unique_ptr<TreeNode>> one;
    one.push_back(openzone::TreeStore::makeParent({"c", "c.test", ""}));
    store.replaceChildren(store.root(), std::move(one));

    const std::vector<std::string> expected = {"insert:2", "inserted",
                                               "remove:2", "removed",
                                               "insert:1", "inserted"};
    t.check(obs.events == expected,
            "replaceChildren should report removal then insertion");
    t.check(store.findParent("a") == nullptr && store.findParent("c"),
            "old children should be gone after replacement");
    t.check(store.findContainingParent(store.root()) == nullptr,
            "root has no containing parent");
    store.setObserver(nullptr);
}

void test_name_field_round_trip(TestContext &t) {
    namespace RF = openzone::RecordForm;
    openzone::Record apex{"r", "z", "example.com", "A", "1.1.1.1", 1, true};
    auto f = RF::seed("example.com", apex);
    t.check(f.name == "@", "apex record should seed name '@'");
    auto p = RF::package("example.com", f);
    t.check(p.ok() && p.payload->name == "example.com",
            "'@' should package as the zone name");

    openzone::Record www{"r", "z", "www.example.com", "CNAME", "example.com",
                         1, true};
    f = RF::seed("example.com", www);
    t.check(f.name == "www", "sub-record should seed its relative name");
    p = RF::package("example.com", f);
    t.check(p.ok() && p.payload->name == "www.example.com",
            "relative name should package as the full name");

    auto fresh = RF::seed("example.com", std::nullopt);
    t.check(fresh.name == "@" && fresh.content.empty() && fresh.ttl == "1" &&
                fresh.proxied,
            "create dialog should seed @, empty content, ttl 1, proxied");

    // A name that only looks like the zone is not stripped.
    openzone::Record other{"r", "z", "notexample.com", "A", "1.1.1.1", 1,
                           true};
    t.check(RF::seed("example.com", other).name == "notexample.com",
            "suffix stripping should require the dot separator");
}

void test_ttl_parse(TestContext &t) {
    namespace RF = openzone::RecordForm;
    t.check(RF::parseTtl("300") == 300, "'300' should parse to 300");
    t.check(RF::parseTtl(" 600 ") == 600, "whitespace should be ignored");
    t.check(RF::parseTtl("abc") == 1, "non-numeric TTL should fall back to 1");
    t.check(RF::parseTtl("12abc") == 1, "trailing junk should fall back to 1");
    t.check(RF::parseTtl("") == 1, "empty TTL should fall back to 1");

    openzone::RecordFields f;
    f.content = "1.2.3.4";
    f.ttl = "soon";
    auto p = RF::package("example.com", f);
    t.check(p.ok() && p.payload->ttl == 1,
            "bad TTL should not block the dialog");
}

void test_package_validation(TestContext &t) {
    namespace RF = openzone::RecordForm;
    openzone::RecordFields f;
    f.type = "  cname ";
    f.name = " www ";
    f.content = " target.example.net ";
    auto p = RF::package("example.com", f);
    t.check(p.ok(), "well-formed fields should package");
    if (p.ok()) {
        t.check(p.payload->type == "CNAME", "type should be upper-cased");
        t.check(p.payload->content == "target.example.net",
                "content should be trimmed");
    }

    f.type = "   ";
    p = RF::package("example.com", f);
    t.check(!p.ok() && p.error &&
                p.error->field == openzone::ValidationError::Field::Type,
            "blank type should be rejected");

    f.type = "A";
    f.name = "";
    p = RF::package("example.com", f);
    t.check(!p.ok() && p.error &&
                p.error->field == openzone::ValidationError::Field::Name,
            "blank name should be rejected");

    f.name = "@";
    f.content = " ";
    p = RF::package("example.com", f);
    t.check(!p.ok() && p.error &&
                p.error->field == openzone::ValidationError::Field::Content,
            "blank content should be rejected");

    // Semantic checks belong to the service.
    f.type = "A";
    f.content = "not-an-address";
    t.check(RF::package("example.com", f).ok(),
            "type/content mismatches should be accepted");
}

void test_interaction_resumes_once(TestContext &t) {
    int calls = 0;
    std::optional<int> seen;
    openzone::Interaction<int> i([&](std::optional<int> v) {
        ++calls;
        seen = v;
    });
    auto copy = i;
    t.check(copy.resume(7), "first resume should succeed");
    t.check(!i.resume(8), "second resume should be rejected");
    t.check(!i.cancel(), "cancel after resume should be rejected");
    t.check(calls == 1 && seen && *seen == 7,
            "continuation should run once with the first value");
    t.check(i.resumed(), "copies should share the resumed state");

    int cancelCalls = 0;
    bool gotValue = true;
    openzone::Interaction<bool> c([&](std::optional<bool> v) {
        ++cancelCalls;
        gotValue = v.has_value();
    });
    t.check(c.cancel(), "cancel should resume");
    t.check(cancelCalls == 1 && !gotValue,
            "cancellation should resume without a value");
}

MutationPayload payloadWithContent(const std::string &content) {
    MutationPayload p;
    p.type = "A";
    p.name = "example.com";
    p.content = content;
    p.ttl = 1;
    p.proxied = true;
    return p;
}

std::string recordContent(const Fixture &f, const std::string &zone,
                          const std::string &rec) {
    const TreeNode *n = f.app.store.findChild(zone, rec);
    if (!n || !n->record())
        return {};
    return n->record()->content;
}

void test_exclusive_dispatch_skips_superseded(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);
    f.app.controller.loadChildren(f.zone("z1"));
    f.runner->drain();

    auto &d = f.app.dispatcher;
    d.submit(openzone::MutationRequest::update(
        "z1", "r1", payloadWithContent("10.0.0.1"))); // A
    d.submit(openzone::MutationRequest::update(
        "z1", "r1", payloadWithContent("2.2.2.2"))); // B
    t.check(f.runner->pendingJobs() == 2, "both submissions should be posted");

    f.runner->resolve(1); // B answers first
    f.runner->deliver();  // B commits and schedules the reload
    f.runner->resolve(1); // the reload
    f.runner->deliver();
    t.check(recordContent(f, "z1", "r1") == "2.2.2.2",
            "tree should show B's outcome");

    f.runner->resolve(0); // A arrives late
    f.runner->deliver();
    t.check(recordContent(f, "z1", "r1") == "2.2.2.2",
            "late result of A must not alter the tree");
    t.check(d.discardedCount() == 1, "A's commit should be discarded");
    t.check(f.gw->callCount(Op::Update) == 1,
            "A was superseded before it started and should not reach the "
            "service");
    t.check(f.sink.count(Severity::Error) == 0,
            "superseded mutation should not notify an error");
    t.check(f.sink.count(Severity::Info) >= 1 && !d.busy(),
            "B should notify success and free the slot");
}

void test_exclusive_dispatch_discards_late_commit(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);
    f.app.controller.loadChildren(f.zone("z1"));
    f.runner->drain();
    const int listingsBefore = f.gw->callCount(Op::ListChildren);

    auto &d = f.app.dispatcher;
    const auto genA = d.submit(openzone::MutationRequest::update(
        "z1", "r1", payloadWithContent("10.0.0.1")));
    f.runner->resolve(0); // A's round-trip done, commit not yet delivered
    const auto genB = d.submit(openzone::MutationRequest::update(
        "z1", "r1", payloadWithContent("2.2.2.2")));
    t.check(genB > genA, "generations should increase");
    f.runner->resolve(0); // B
    f.runner->deliver();  // A's commit (stale) then B's commit
    f.runner->drain();

    t.check(d.discardedCount() == 1, "A's late commit should be discarded");
    t.check(f.gw->callCount(Op::ListChildren) == listingsBefore + 1,
            "only B should trigger a reload");
    t.check(recordContent(f, "z1", "r1") == "2.2.2.2",
            "tree should reflect B only");
    int updatedNotes = 0;
    for (const auto &n : f.sink.notes)
        updatedNotes += n.title == "Record updated" ? 1 : 0;
    t.check(updatedNotes == 1, "only B should report success");
}

void test_mutation_reload_supersedes_running_listing(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);
    TreeNode *z1 = f.zone("z1");
    f.app.controller.loadChildren(z1);
    f.runner->drain();
    const int listingsBefore = f.gw->callCount(Op::ListChildren);

    f.app.dispatcher.submit(openzone::MutationRequest::update(
        "z1", "r1", payloadWithContent("2.2.2.2"))); // job 0
    f.app.controller.loadChildren(z1);                // job 1
    f.runner->resolve(1); // listing reads 1.1.1.1
    f.runner->resolve(0); // update lands on the service
    t.check(f.runner->pendingCommits() == 2, "both commits should be held");

    f.runner->deliverAt(1); // mutation commits first and reloads the zone
    f.runner->deliverAt(0); // pre-mutation listing arrives afterwards
    t.check(recordContent(f, "z1", "r1").empty(),
            "pre-mutation listing must not be installed");
    t.check(z1->loadState() == LoadState::Loading,
            "zone should wait for the fresh listing");

    f.runner->drain();
    t.check(recordContent(f, "z1", "r1") == "2.2.2.2",
            "tree should show the mutated record");
    t.check(z1->loadState() == LoadState::Loaded, "zone should be Loaded");
    t.check(f.gw->callCount(Op::ListChildren) == listingsBefore + 2,
            "the mutation should trigger its own listing");
}

void test_stopped_runner_cancels_gateway_calls(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);

    f.app.controller.loadChildren(f.zone("z1"));
    f.runner->stop();
    f.runner->resolve(0);
    t.check(f.gw->canceledCount(Op::ListChildren) == 1,
            "listing should observe the stop flag");
    t.check(f.runner->pendingCommits() == 0,
            "no commit should be queued after stop");

    f.app.dispatcher.submit(openzone::MutationRequest::update(
        "z1", "r1", payloadWithContent("2.2.2.2")));
    f.runner->resolve(0);
    t.check(f.gw->callCount(Op::Update) == 0,
            "mutation should not reach the service after stop");
    t.check(f.gw->records("z1").size() == 1 &&
                f.gw->records("z1")[0].content == "1.1.1.1",
            "service data should be untouched");
}

void test_edit_scenario(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);
    TreeNode *z1 = f.zone("z1");
    f.app.controller.loadChildren(z1);
    f.runner->drain();

    TreeNode *rec = f.app.store.findChild("z1", "r1");
    t.check(rec != nullptr, "record should be listed");
    t.check(f.app.controller.activate(rec) ==
                openzone::TreeController::Activation::EditRequested,
            "activating a record should ask for the edit dialog");
    t.check(f.app.workflow.editRecord(rec), "edit should open the dialog");
    t.check(f.host.lastEdit.has_value() && f.host.editReply.has_value(),
            "dialog should be requested");
    if (!f.host.lastEdit || !f.host.editReply)
        return;

    openzone::RecordFields fields = f.host.lastEdit->fields;
    t.check(fields.name == "@", "apex name should be shown as '@'");
    t.check(fields.content == "1.1.1.1" && fields.ttl == "1" &&
                fields.proxied && fields.type == "A",
            "fields should be seeded from the record");
    fields.content = "2.2.2.2";
    fields.ttl = "600";
    auto packaged =
        openzone::RecordForm::package(f.host.lastEdit->zoneName, fields);
    t.check(packaged.ok(), "edited fields should validate");
    if (!packaged.ok())
        return;
    f.host.editReply->resume(*packaged.payload);
    f.runner->drain();

    t.check(f.gw->callCount(Op::Update) == 1, "updateChild should be called");
    const auto sent = f.gw->lastPayload();
    t.check(sent && sent->name == "example.com" && sent->content == "2.2.2.2" &&
                sent->ttl == 600,
            "update should send name example.com, content 2.2.2.2, ttl 600");
    t.check(recordContent(f, "z1", "r1") == "2.2.2.2",
            "reloaded subtree should show the new content");
    t.check(z1->loadState() == LoadState::Loaded,
            "zone should be Loaded after the reload");
}

void test_delete_failure_keeps_node(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);
    f.app.controller.loadChildren(f.zone("z2"));
    f.runner->drain();
    const int listingsBefore = f.gw->callCount(Op::ListChildren);

    TreeNode *rec = f.app.store.findChild("z2", "r3");
    const std::string labelBefore = rec ? rec->label() : std::string();
    f.gw->failNext(Op::Delete, GatewayError::remote("Record locked", 409));
    t.check(f.app.workflow.deleteRecord(rec), "delete should ask to confirm");
    t.check(f.host.confirmReply.has_value() && f.host.confirmLabels.size() == 1,
            "confirmation should be requested once");
    if (!f.host.confirmReply)
        return;
    f.host.confirmReply->resume(true);
    f.runner->drain();

    const TreeNode *after = f.app.store.findChild("z2", "r3");
    t.check(after != nullptr, "record should still be present");
    t.check(after && after->label() == labelBefore,
            "record should be unchanged");
    t.check(f.zone("z2")->childCount() == 2, "zone should keep both records");
    t.check(f.sink.count(Severity::Error) == 1,
            "failed delete should notify an error");
    t.checkContains(f.sink.notes.back().message, "Record locked",
                    "notification should carry the gateway message");
    t.check(f.gw->callCount(Op::ListChildren) == listingsBefore,
            "failed delete should not reload the zone");
}

void test_delete_success_and_cancel(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);
    f.app.controller.loadChildren(f.zone("z2"));
    f.runner->drain();

    // Declined confirmation: nothing happens.
    f.app.workflow.deleteRecord(f.app.store.findChild("z2", "r3"));
    if (f.host.confirmReply)
        f.host.confirmReply->resume(false);
    f.runner->drain();
    t.check(f.gw->callCount(Op::Delete) == 0,
            "declined confirmation should not call the gateway");

    f.app.workflow.deleteRecord(f.app.store.findChild("z2", "r3"));
    t.check(f.app.store.findChild("z2", "r3") != nullptr,
            "record should stay until the service confirms");
    if (f.host.confirmReply)
        f.host.confirmReply->resume(true);
    t.check(f.app.store.findChild("z2", "r3") != nullptr,
            "record should not be removed speculatively");
    f.runner->drain();
    t.check(f.app.store.findChild("z2", "r3") == nullptr,
            "record should disappear after the confirmed delete");
    t.check(f.zone("z2")->childCount() == 1, "zone should list one record");
}

void test_add_under_enclosing_parent(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);
    f.app.controller.loadChildren(f.zone("z2"));
    f.runner->drain();

    // Cursor on a record: the record's zone is the target.
    TreeNode *cursor = f.app.store.findChild("z2", "r2");
    t.check(f.app.workflow.addRecord(cursor), "add should open the dialog");
    t.check(f.host.lastEdit && !f.host.lastEdit->existing &&
                f.host.lastEdit->zoneName == "example.org",
            "add should target the enclosing zone");
    if (!f.host.lastEdit || !f.host.editReply)
        return;
    openzone::RecordFields fields = f.host.lastEdit->fields;
    fields.type = "txt";
    fields.name = "_verify";
    fields.content = "token=abc";
    auto p = openzone::RecordForm::package("example.org", fields);
    t.check(p.ok(), "new record should validate");
    if (!p.ok())
        return;
    f.host.editReply->resume(*p.payload);
    f.runner->drain();

    t.check(f.gw->callCount(Op::Create) == 1, "createChild should be called");
    const auto sent = f.gw->lastPayload();
    t.check(sent && sent->type == "TXT" && sent->name == "_verify.example.org",
            "create payload should carry the qualified name and type");
    t.check(f.zone("z2")->childCount() == 3,
            "reloaded zone should list the new record");

    // No zone under the cursor: nothing to add to.
    t.check(!f.app.workflow.addRecord(nullptr),
            "add without a zone should be refused");
    t.check(f.sink.count(Severity::Warning) == 1,
            "refused add should warn the operator");
}

void test_edit_cancel_and_vanished_record(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);
    f.app.controller.loadChildren(f.zone("z1"));
    f.runner->drain();

    f.app.workflow.editRecord(f.app.store.findChild("z1", "r1"));
    if (f.host.editReply)
        f.host.editReply->cancel();
    f.runner->drain();
    t.check(f.gw->callCount(Op::Update) == 0,
            "cancelled dialog should not call the gateway");

    // The zone reloads while the dialog is open and the record is gone.
    f.app.workflow.editRecord(f.app.store.findChild("z1", "r1"));
    f.gw->clear();
    f.gw->addZone({"z1", "example.com", "active"});
    f.app.controller.loadChildren(f.zone("z1"));
    f.runner->drain();
    if (f.host.editReply)
        f.host.editReply->resume(payloadWithContent("3.3.3.3"));
    f.runner->drain();
    t.check(f.gw->callCount(Op::Update) == 0,
            "edit of a vanished record should not be submitted");
    t.check(f.sink.count(Severity::Warning) == 1,
            "vanished record should be reported");
}

void test_edit_requires_record(TestContext &t) {
    Fixture f;
    seedExample(f);
    loadAll(f);
    t.check(!f.app.workflow.editRecord(f.zone("z1")),
            "edit on a zone should be refused");
    t.check(!f.app.workflow.deleteRecord(f.zone("z1")),
            "delete on a zone should be refused");
    t.check(!f.host.lastEdit && f.host.confirmLabels.empty(),
            "no dialog should open for refused actions");
}

void test_mock_gateway_contract(TestContext &t) {
    openzone::MockZoneGateway gw;
    auto zones = gw.listParents();
    t.check(zones.ok() && zones.value().size() == 3,
            "demo data should list three zones");
    if (zones.ok() && zones.value().size() == 3)
        t.check(zones.value()[0].name == "example.com",
                "zones should be sorted by name");

    auto missing = gw.listChildren("nope");
    t.check(!missing.ok() && missing.error().status == 404,
            "unknown zone should be a 404 remote error");
    t.checkContains(missing.ok() ? std::string() : missing.error().describe(),
                    "HTTP 404", "describe should include the status");

    auto canceled = gw.deleteChild("zone-1", "rec-a", [] { return true; });
    t.check(!canceled.ok() &&
                canceled.error().kind == GatewayError::Kind::Canceled,
            "cancelled calls should report Canceled");
    t.check(gw.records("zone-1").size() == 3,
            "cancelled delete should not remove anything");

    auto noZone = gw.deleteChild("nope", "rec-a");
    t.check(!noZone.ok() && noZone.error().status == 404,
            "delete in an unknown zone should be a 404 remote error");
    t.checkContains(noZone.ok() ? std::string() : noZone.error().message,
                    "Zone not found", "delete should name the missing zone");
    t.check(gw.records("nope").empty(),
            "failed delete should not create a record list");

    auto noRecords = gw.deleteChild("zone-3", "rec-a");
    t.check(!noRecords.ok() && noRecords.error().status == 404,
            "delete in a zone without records should be a 404");
    t.checkContains(noRecords.ok() ? std::string() : noRecords.error().message,
                    "Record not found", "delete should name the missing record");
    t.check(gw.records("zone-1").size() == 3,
            "failed deletes should leave other zones alone");

    MutationPayload p;
    p.type = "MX";
    p.name = "mail";
    p.content = "mx.example.com";
    p.proxied = true;
    auto created = gw.createChild("zone-1", p);
    t.check(created.ok() && created.value().name == "mail.example.com",
            "mock should qualify relative names");
    t.check(created.ok() && !created.value().proxied,
            "proxy flag should not stick on non-proxiable types");
}

} // namespace

int main() {
    TestContext t;
    test_load_root_seeds_placeholders(t);
    test_load_root_failure_keeps_children(t);
    test_load_root_reentrant_ignored(t);
    test_load_children_counts_and_labels(t);
    test_load_children_empty_installs_info_leaf(t);
    test_load_children_reentrant_ignored(t);
    test_load_children_failure_and_reset(t);
    test_stale_children_load_discarded_after_root_refresh(t);
    test_reload_cancels_pending_listing(t);
    test_replace_children_notifies_in_one_step(t);
    test_name_field_round_trip(t);
    test_ttl_parse(t);
    test_package_validation(t);
    test_interaction_resumes_once(t);
    test_exclusive_dispatch_skips_superseded(t);
    test_exclusive_dispatch_discards_late_commit(t);
    test_mutation_reload_supersedes_running_listing(t);
    test_stopped_runner_cancels_gateway_calls(t);
    test_edit_scenario(t);
    test_delete_failure_keeps_node(t);
    test_delete_success_and_cancel(t);
    test_add_under_enclosing_parent(t);
    test_edit_cancel_and_vanished_record(t);
    test_edit_requires_record(t);
    test_mock_gateway_contract(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] openzone_core_tests\n";
    return EXIT_SUCCESS;
}
