/**
 * @file test_container.cpp
 * @brief Tests for the di::Container: resolution, annotations, failures and graph rendering.
 */
#include "lft_service.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

using namespace liftoff;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace app
{
struct Config
{
    std::string dsn{"memory://"};
};
struct Db
{
    explicit Db(std::string d) : dsn(std::move(d)) {}
    std::string dsn;
};
struct Route
{
    std::string path;
};
struct Api
{
    std::shared_ptr<Db> db;
    std::vector<std::string> paths;
};
struct Loop
{
};
struct Unprovided
{
};
} // namespace app

class ContainerTest : public ::testing::Test
{
  protected:
    di::Container c_;
    int config_builds_ = 0;

    void provide_config()
    {
        ASSERT_TRUE(c_.provide(di::provide(
                                   [this]
                                   {
                                       ++config_builds_;
                                       return std::make_shared<app::Config>();
                                   }))
                        .is_ok());
    }
};

TEST_F(ContainerTest, ResolvesDependenciesOnce)
{
    provide_config();
    ASSERT_TRUE(
        c_.provide(di::provide([](std::shared_ptr<app::Config> cfg) { return std::make_shared<app::Db>(cfg->dsn); }))
            .is_ok());

    auto db1 = c_.resolve<app::Db>();
    auto db2 = c_.resolve<app::Db>();
    auto cfg = c_.resolve<app::Config>();
    ASSERT_TRUE(db1.is_ok());
    ASSERT_TRUE(db2.is_ok());
    ASSERT_TRUE(cfg.is_ok());
    EXPECT_EQ(db1.content(), db2.content());
    EXPECT_EQ(db1.content()->dsn, "memory://");
    EXPECT_EQ(config_builds_, 1);
}

TEST_F(ContainerTest, ConstructionIsLazy)
{
    provide_config();
    EXPECT_EQ(config_builds_, 0);
    EXPECT_EQ(c_.provider_count(), 1u);
}

TEST_F(ContainerTest, InvokeReceivesResolvedArguments)
{
    provide_config();
    std::string seen;
    Error err = c_.invoke(di::invoke([&](std::shared_ptr<app::Config> cfg) { seen = cfg->dsn; }));
    ASSERT_TRUE(err.is_ok());
    EXPECT_EQ(seen, "memory://");
}

TEST_F(ContainerTest, InvokeMayReturnError)
{
    Error err = c_.invoke(di::invoke([]() { return Error::failure("refused"); }));
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.message(), "refused");
}

TEST_F(ContainerTest, InvokeThatThrowsFails)
{
    Error err = c_.invoke(di::invoke([]() { throw std::runtime_error("bad invoke"); }));
    ASSERT_TRUE(err.is_error());
    EXPECT_THAT(err.message(), HasSubstr("bad invoke"));
    EXPECT_THAT(err.message(), HasSubstr("test_container.cpp"));
}

TEST_F(ContainerTest, NamedValues)
{
    ASSERT_TRUE(c_.provide(di::provide([] { return std::make_shared<app::Db>("primary"); }, {.name = "rw"})).is_ok());
    ASSERT_TRUE(c_.provide(di::provide([] { return std::make_shared<app::Db>("replica"); }, {.name = "ro"})).is_ok());

    std::string rw, ro;
    Error err = c_.invoke(di::invoke(
        [&](di::Named<app::Db, "rw"> a, di::Named<app::Db, "ro"> b)
        {
            rw = a->dsn;
            ro = b.value->dsn;
        }));
    ASSERT_TRUE(err.is_ok());
    EXPECT_EQ(rw, "primary");
    EXPECT_EQ(ro, "replica");

    // The unnamed slot is distinct.
    auto unnamed = c_.resolve<app::Db>();
    ASSERT_TRUE(unnamed.is_error());
    EXPECT_EQ(unnamed.error().kind(), ErrorKind::MissingDependency);
}

TEST_F(ContainerTest, GroupsPreserveRegistrationOrder)
{
    for (const char *path : {"/a", "/b", "/c"})
    {
        ASSERT_TRUE(c_.provide(di::supply(std::make_shared<app::Route>(app::Route{path}), {.group = "routes"})).is_ok());
    }

    std::vector<std::string> paths;
    Error err = c_.invoke(di::invoke(
        [&](di::Group<app::Route, "routes"> routes)
        {
            for (const auto &r : routes)
            {
                paths.push_back(r->path);
            }
        }));
    ASSERT_TRUE(err.is_ok());
    EXPECT_THAT(paths, ElementsAre("/a", "/b", "/c"));
}

TEST_F(ContainerTest, EmptyGroupIsNotAnError)
{
    auto r = c_.resolve_group<app::Route>("nothing");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.content().empty());
}

TEST_F(ContainerTest, NameAndGroupTogetherRejected)
{
    Error err = c_.provide(di::provide([] { return std::make_shared<app::Route>(); }, {.name = "n", .group = "g"}));
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.kind(), ErrorKind::InvalidProvider);
    EXPECT_THAT(err.message(), HasSubstr("may not specify both name and group"));
}

TEST_F(ContainerTest, DuplicateProviderRejected)
{
    provide_config();
    Error err = c_.provide(di::provide([] { return std::make_shared<app::Config>(); }));
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.kind(), ErrorKind::InvalidProvider);
    EXPECT_THAT(err.message(), HasSubstr("already provided by"));
    EXPECT_EQ(c_.provider_count(), 1u);
}

TEST_F(ContainerTest, MissingDependencyNamesRequester)
{
    ASSERT_TRUE(
        c_.provide(di::provide([](std::shared_ptr<app::Unprovided>) { return std::make_shared<app::Loop>(); })).is_ok());

    Error err = c_.invoke(di::invoke([](std::shared_ptr<app::Loop>) {}));
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.kind(), ErrorKind::MissingDependency);
    EXPECT_THAT(err.message(), HasSubstr("missing dependency: no provider of app::Unprovided"));
    EXPECT_THAT(err.message(), HasSubstr("required by constructor of app::Loop"));
    EXPECT_TRUE(c_.can_visualize(err));

    const std::string dot = c_.visualize(err);
    EXPECT_THAT(dot, HasSubstr("\"app::Unprovided\" [style=dashed color=red];"));
    EXPECT_THAT(dot, HasSubstr("\"app::Loop\" -> \"app::Unprovided\";"));
}

TEST_F(ContainerTest, CycleIsDetected)
{
    ASSERT_TRUE(
        c_.provide(di::provide([](std::shared_ptr<app::Api>) { return std::make_shared<app::Loop>(); })).is_ok());
    ASSERT_TRUE(
        c_.provide(di::provide([](std::shared_ptr<app::Loop>) { return std::make_shared<app::Api>(); })).is_ok());

    auto r = c_.resolve<app::Loop>();
    ASSERT_TRUE(r.is_error());
    const Error &err = r.error();
    EXPECT_EQ(err.kind(), ErrorKind::DependencyCycle);
    EXPECT_EQ(err.message(), "dependency cycle detected: app::Loop -> app::Api -> app::Loop");

    const std::string dot = c_.visualize(err);
    EXPECT_THAT(dot, HasSubstr("color=red"));
}

TEST_F(ContainerTest, ConstructorFailureIsWrapped)
{
    ASSERT_TRUE(c_.provide(di::provide([]() -> std::shared_ptr<app::Config> { throw std::runtime_error("no disk"); }))
                    .is_ok());
    ASSERT_TRUE(c_.provide(di::provide([]() -> Fallible<std::shared_ptr<app::Route>>
                                       { return Fallible<std::shared_ptr<app::Route>>::error(Error::failure("bad route")); }))
                    .is_ok());

    auto cfg = c_.resolve<app::Config>();
    ASSERT_TRUE(cfg.is_error());
    EXPECT_EQ(cfg.error().kind(), ErrorKind::ConstructorFailed);
    EXPECT_THAT(cfg.error().message(), HasSubstr("constructor of app::Config registered at"));
    EXPECT_THAT(cfg.error().message(), HasSubstr("no disk"));

    auto route = c_.resolve<app::Route>();
    ASSERT_TRUE(route.is_error());
    EXPECT_EQ(route.error().kind(), ErrorKind::ConstructorFailed);
    EXPECT_THAT(route.error().message(), HasSubstr("bad route"));
    ASSERT_EQ(route.error().causes().size(), 1u);
    EXPECT_EQ(route.error().causes()[0].message(), "bad route");
}

TEST_F(ContainerTest, NullConstructorResultFails)
{
    ASSERT_TRUE(c_.provide(di::provide([] { return std::shared_ptr<app::Config>{}; })).is_ok());
    auto r = c_.resolve<app::Config>();
    ASSERT_TRUE(r.is_error());
    EXPECT_THAT(r.error().message(), HasSubstr("constructor returned null"));
}

TEST_F(ContainerTest, PopulateStoresInstance)
{
    provide_config();
    std::shared_ptr<app::Config> target;
    ASSERT_TRUE(c_.invoke(di::populate(target)).is_ok());
    ASSERT_NE(target, nullptr);
    EXPECT_EQ(target->dsn, "memory://");
}

TEST_F(ContainerTest, SupplySharesInstance)
{
    auto db = std::make_shared<app::Db>("supplied");
    ASSERT_TRUE(c_.provide(di::supply(db)).is_ok());
    auto r = c_.resolve<app::Db>();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.content(), db);
}

TEST_F(ContainerTest, VisualizeListsProvidersAndGroups)
{
    provide_config();
    ASSERT_TRUE(c_.provide(di::supply(std::make_shared<app::Route>(), {.group = "routes"})).is_ok());
    ASSERT_TRUE(c_.provide(di::provide(
                               [](std::shared_ptr<app::Config>, di::Group<app::Route, "routes">)
                               { return std::make_shared<app::Api>(); }))
                    .is_ok());

    const std::string dot = c_.visualize();
    EXPECT_THAT(dot, HasSubstr("digraph {"));
    EXPECT_THAT(dot, HasSubstr("rankdir=RL;"));
    EXPECT_THAT(dot, HasSubstr("\"[]app::Route[group=routes]\" [shape=diamond];"));
    EXPECT_THAT(dot, HasSubstr("\"app::Api\" -> \"[]app::Route[group=routes]\";"));
    EXPECT_THAT(dot, HasSubstr("\"app::Api\" -> \"app::Config\";"));
    EXPECT_THAT(dot, ::testing::Not(HasSubstr("color=red")));
    EXPECT_FALSE(c_.can_visualize(Error::failure("plain")));
}

// ============================================================================
// Optional dependencies
// ============================================================================

TEST_F(ContainerTest, OptionalDependencyMayBeMissing)
{
    ASSERT_TRUE(c_.provide(di::provide(
                               [](di::Optional<app::Config> cfg)
                               { return std::make_shared<app::Db>(cfg ? cfg->dsn : std::string("degraded")); }))
                    .is_ok());

    auto db = c_.resolve<app::Db>();
    ASSERT_TRUE(db.is_ok());
    EXPECT_EQ(db.content()->dsn, "degraded");

    // A missing optional dependency leaves nothing to highlight.
    const std::string dot = c_.visualize();
    EXPECT_THAT(dot, HasSubstr("\"app::Db\" -> \"app::Config\" [style=dotted];"));
}

TEST_F(ContainerTest, OptionalDependencyIsUsedWhenProvided)
{
    provide_config();
    app::Config *seen = nullptr;
    Error err = c_.invoke(di::invoke([&](di::Optional<app::Config> cfg) { seen = cfg.value.get(); }));
    ASSERT_TRUE(err.is_ok());
    ASSERT_NE(seen, nullptr);
    EXPECT_EQ(seen->dsn, "memory://");
    EXPECT_EQ(config_builds_, 1);
}

TEST_F(ContainerTest, OptionalNamedDependency)
{
    ASSERT_TRUE(c_.provide(di::provide([] { return std::make_shared<app::Db>("primary"); }, {.name = "rw"})).is_ok());

    std::string rw = "unset";
    bool has_ro = true;
    Error err = c_.invoke(di::invoke(
        [&](di::Optional<di::Named<app::Db, "rw">> a, di::Optional<di::Named<app::Db, "ro">> b)
        {
            rw = a->dsn;
            has_ro = static_cast<bool>(b);
        }));
    ASSERT_TRUE(err.is_ok());
    EXPECT_EQ(rw, "primary");
    EXPECT_FALSE(has_ro);
}

TEST_F(ContainerTest, OptionalDependencyStillReportsItsOwnFailures)
{
    ASSERT_TRUE(c_.provide(di::provide([]() -> std::shared_ptr<app::Config> { throw std::runtime_error("no disk"); }))
                    .is_ok());

    Error err = c_.invoke(di::invoke([](di::Optional<app::Config>) {}));
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.kind(), ErrorKind::ConstructorFailed);
    EXPECT_THAT(err.message(), HasSubstr("no disk"));
}

// ============================================================================
// Constructors with several outputs
// ============================================================================

TEST_F(ContainerTest, TupleConstructorRegistersEveryOutput)
{
    provide_config();
    int builds = 0;
    ASSERT_TRUE(c_.provide(di::provide(
                               [&builds](std::shared_ptr<app::Config> cfg)
                               {
                                   ++builds;
                                   return std::tuple{di::Named<app::Db, "rw">{std::make_shared<app::Db>(cfg->dsn + "rw")},
                                                     di::Named<app::Db, "ro">{std::make_shared<app::Db>(cfg->dsn + "ro")},
                                                     di::GroupMember<app::Route, "routes">{
                                                         std::make_shared<app::Route>(app::Route{"/db"})},
                                                     std::make_shared<app::Api>()};
                               }))
                    .is_ok());
    ASSERT_TRUE(c_.provide(di::supply(std::make_shared<app::Route>(app::Route{"/health"}), {.group = "routes"})).is_ok());

    std::string rw, ro;
    std::vector<std::string> paths;
    Error err = c_.invoke(di::invoke(
        [&](di::Named<app::Db, "rw"> a, di::Named<app::Db, "ro"> b, di::Group<app::Route, "routes"> routes,
            std::shared_ptr<app::Api> api)
        {
            rw = a->dsn;
            ro = b->dsn;
            for (const auto &r : routes)
            {
                paths.push_back(r->path);
            }
            EXPECT_NE(api, nullptr);
        }));
    ASSERT_TRUE(err.is_ok());
    EXPECT_EQ(rw, "memory://rw");
    EXPECT_EQ(ro, "memory://ro");
    EXPECT_THAT(paths, ElementsAre("/db", "/health"));
    EXPECT_EQ(builds, 1);
    EXPECT_EQ(c_.provider_count(), 3u);

    const std::string dot = c_.visualize();
    EXPECT_THAT(dot, HasSubstr("subgraph cluster_1 {"));
    EXPECT_THAT(dot, HasSubstr("\"app::Db[name=ro]\" -> \"app::Config\";"));
}

TEST_F(ContainerTest, FallibleTupleConstructorFailureCoversAllOutputs)
{
    ASSERT_TRUE(c_.provide(di::provide(
                               []() -> Fallible<std::tuple<std::shared_ptr<app::Config>, di::Named<app::Db, "rw">>>
                               {
                                   return Fallible<std::tuple<std::shared_ptr<app::Config>, di::Named<app::Db, "rw">>>::error(
                                       Error::failure("storage offline"));
                               }))
                    .is_ok());

    auto db = c_.resolve<app::Db>("rw");
    ASSERT_TRUE(db.is_error());
    EXPECT_EQ(db.error().kind(), ErrorKind::ConstructorFailed);
    EXPECT_THAT(db.error().message(), HasSubstr("constructor of app::Config, app::Db[name=rw] registered at"));
    EXPECT_THAT(db.error().message(), HasSubstr("storage offline"));
}

TEST_F(ContainerTest, TupleConstructorRejectsAnnotationsAndDuplicates)
{
    Error annotated = c_.provide(di::provide(
        [] { return std::tuple{std::make_shared<app::Config>(), std::make_shared<app::Route>()}; }, {.name = "x"}));
    ASSERT_TRUE(annotated.is_error());
    EXPECT_EQ(annotated.kind(), ErrorKind::InvalidProvider);
    EXPECT_THAT(annotated.message(), HasSubstr("cannot take a name or group annotation"));

    Error twice = c_.provide(di::provide(
        [] { return std::tuple{std::make_shared<app::Config>(), std::make_shared<app::Config>()}; }));
    ASSERT_TRUE(twice.is_error());
    EXPECT_THAT(twice.message(), HasSubstr("produced twice by the same constructor"));

    // A rejected provider registers none of its outputs.
    provide_config();
    Error clash = c_.provide(di::provide(
        [] { return std::tuple{std::make_shared<app::Route>(), std::make_shared<app::Config>()}; }));
    ASSERT_TRUE(clash.is_error());
    EXPECT_THAT(clash.message(), HasSubstr("already provided by"));
    EXPECT_FALSE(c_.has_provider(di::Dependency{typeid(app::Route), "app::Route", {}, {}}));
    EXPECT_EQ(c_.provider_count(), 1u);
}
