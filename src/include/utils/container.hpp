#pragma once
/**
 * @file container.hpp
 * @brief Typed provider registry that builds the application's object graph.
 *
 * Components are described by constructors: callables returning
 * `std::shared_ptr<T>` (or `Fallible<std::shared_ptr<T>>`) whose parameters
 * name their dependencies:
 *
 *  - `std::shared_ptr<U>`       the unnamed instance of U
 *  - `Named<U, "primary">`      the instance of U registered under a name
 *  - `Group<U, "routes">`       every instance of U registered into a group,
 *                               in registration order
 *  - `Optional<U>`,             like the above, but a missing provider yields
 *    `Optional<Named<U, "n">>`  an empty value instead of MissingDependency
 *
 * A constructor may produce several values at once by returning a
 * `std::tuple` (optionally inside `Fallible`) whose elements are
 * `std::shared_ptr<T>`, `Named<T, "n">` or `GroupMember<T, "g">`. Each element
 * is registered as its own key; the constructor still runs only once.
 *
 * @code
 * di::provide([](std::shared_ptr<Config> cfg) {
 *     return std::tuple{Named<Db, "rw">{open_db(*cfg, true)}, Named<Db, "ro">{open_db(*cfg, false)}};
 * });
 * @endcode
 *
 * @code
 * using namespace liftoff;
 * di::Container c;
 * (void)c.provide(di::provide([] { return std::make_shared<Config>(); }));
 * (void)c.provide(di::provide([](std::shared_ptr<Config> cfg) { return std::make_shared<Db>(*cfg); }));
 * (void)c.invoke(di::invoke([](std::shared_ptr<Db> db) { db->ping(); }));
 * @endcode
 *
 * Every (type, name) pair is constructed at most once and then shared. Values
 * are built lazily, on first request, in dependency order. Failures are
 * reported as `Error`s:
 *
 *  - MissingDependency  no provider for a requested (type, name)
 *  - DependencyCycle    a constructor (indirectly) requires its own result
 *  - ConstructorFailed  a constructor threw or returned a failure
 *  - InvalidProvider    rejected registration (name and group both set, duplicate)
 *
 * The first three can be rendered as a DOT graph with the failing nodes
 * highlighted (`can_visualize`, `visualize`).
 *
 * Not thread-safe; the container is used during single-threaded construction.
 */
#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

#include "liftoff_utils_export.h"
#include "utils/debug_info.hpp"
#include "utils/error.hpp"
#include "utils/format_tools.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace liftoff::di
{

/// String literal usable as a template argument: `Named<Db, "replica">`.
template <std::size_t N> struct FixedString
{
    char value[N]{};

    constexpr FixedString(const char (&str)[N]) { std::copy_n(str, N, value); }
    [[nodiscard]] constexpr std::string_view view() const noexcept { return {value, N - 1}; }
};

/// Parameter wrapper requesting the instance of T registered under `Name`.
template <typename T, FixedString Name> struct Named
{
    std::shared_ptr<T> value;

    static constexpr std::string_view name() noexcept { return Name.view(); }
    T *operator->() const noexcept { return value.get(); }
    T &operator*() const noexcept { return *value; }
};

/// Constructor output contributing one instance of T to group `GroupName`.
template <typename T, FixedString GroupName> struct GroupMember
{
    std::shared_ptr<T> value;

    static constexpr std::string_view group() noexcept { return GroupName.view(); }
};

/// Parameter wrapper for a dependency that may have no provider; `value` is then null.
template <typename T> struct Optional
{
    std::shared_ptr<T> value;

    explicit operator bool() const noexcept { return value != nullptr; }
    T *operator->() const noexcept { return value.get(); }
    T &operator*() const noexcept { return *value; }
};

template <typename T, FixedString Name> struct Optional<Named<T, Name>>
{
    std::shared_ptr<T> value;

    static constexpr std::string_view name() noexcept { return Name.view(); }
    explicit operator bool() const noexcept { return value != nullptr; }
    T *operator->() const noexcept { return value.get(); }
    T &operator*() const noexcept { return *value; }
};

/// Parameter wrapper requesting every instance of T in group `GroupName`.
template <typename T, FixedString GroupName> struct Group
{
    std::vector<std::shared_ptr<T>> values;

    static constexpr std::string_view group() noexcept { return GroupName.view(); }
    [[nodiscard]] std::size_t size() const noexcept { return values.size(); }
    auto begin() const noexcept { return values.begin(); }
    auto end() const noexcept { return values.end(); }
};

/// Annotation of a provided value. At most one of the two may be set.
struct ProvideOptions
{
    std::string name;
    std::string group;
};

/// One requested value: (type, name) or, when `group` is set, a whole group.
struct Dependency
{
    std::type_index type;
    std::string type_name;
    std::string name;
    std::string group;
    bool optional{false};

    [[nodiscard]] bool is_group() const noexcept { return !group.empty(); }
};

/// e.g. `app::Db`, `app::Db[name=replica]`, `[]app::Route[group=routes]`.
LIFTOFF_UTILS_EXPORT std::string describe(const Dependency &dep);

/// One value a constructor produces.
struct Output
{
    std::type_index type;
    std::string type_name;
    ProvideOptions options;
};

/// e.g. `app::Db`, `app::Db[name=rw]`, `app::Route[group=routes]`.
LIFTOFF_UTILS_EXPORT std::string describe(const Output &output);

/// Outputs joined by ", ".
LIFTOFF_UTILS_EXPORT std::string describe(const std::vector<Output> &outputs);

using ErasedValue = std::shared_ptr<void>;

class Container;

/// Type-erased constructor record. Build one with `di::provide()` or `di::supply()`.
struct Provider
{
    std::vector<Output> outputs;
    std::vector<Dependency> dependencies;
    /// Produces one value per entry of `outputs`, in the same order.
    std::function<Fallible<std::vector<ErasedValue>>(Container &)> factory;
    std::string label;
    /// Non-empty when the provider was malformed at the call site; registration then fails.
    std::string invalid_reason;
};

/// Type-erased invocation record. Build one with `di::invoke()` or `di::populate()`.
struct Invocation
{
    std::vector<Dependency> dependencies;
    std::function<Error(Container &)> fn;
    std::string label;
};

class LIFTOFF_UTILS_EXPORT Container
{
  public:
    Container();
    ~Container();

    Container(const Container &) = delete;
    Container &operator=(const Container &) = delete;

    /// Registers a constructor. Fails with InvalidProvider on a bad annotation or duplicate.
    [[nodiscard]] Error provide(Provider provider);

    /// Resolves the invocation's dependencies and calls it. Returns the first failure.
    [[nodiscard]] Error invoke(const Invocation &invocation);

    /// True when some provider registers (type, name) of `dep`. Never constructs anything.
    [[nodiscard]] bool has_provider(const Dependency &dep) const;

    [[nodiscard]] Fallible<ErasedValue> resolve_erased(const Dependency &dep);
    [[nodiscard]] Fallible<std::vector<ErasedValue>> resolve_group_erased(const Dependency &dep);

    template <typename T> [[nodiscard]] Fallible<std::shared_ptr<T>> resolve(std::string_view name = {});
    template <typename T> [[nodiscard]] Fallible<std::vector<std::shared_ptr<T>>> resolve_group(std::string_view group);

    /// True for errors that carry dependency-graph context (missing, cycle, constructor).
    [[nodiscard]] bool can_visualize(const Error &err) const noexcept;

    /**
     * @brief Renders all providers and their dependencies in Graphviz DOT.
     * @param err When visualizable, nodes involved in failures are drawn red.
     */
    [[nodiscard]] std::string visualize(const Error &err = {}) const;

    [[nodiscard]] std::size_t provider_count() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

namespace detail
{

template <typename> inline constexpr bool always_false_v = false;

template <typename O> struct OutputTraits
{
    static_assert(always_false_v<O>,
                  "constructor outputs must be std::shared_ptr<T>, Named<T, \"name\"> or GroupMember<T, \"group\">");
};

template <typename T> struct OutputTraits<std::shared_ptr<T>>
{
    static Output describe(ProvideOptions options) { return {typeid(T), format_tools::type_name<T>(), std::move(options)}; }
    static ErasedValue erase(std::shared_ptr<T> &&v) { return std::move(v); }
};

template <typename T, FixedString Name> struct OutputTraits<Named<T, Name>>
{
    static Output describe(ProvideOptions) { return {typeid(T), format_tools::type_name<T>(), {std::string(Name.view()), {}}}; }
    static ErasedValue erase(Named<T, Name> &&v) { return std::move(v.value); }
};

template <typename T, FixedString GroupName> struct OutputTraits<GroupMember<T, GroupName>>
{
    static Output describe(ProvideOptions)
    {
        return {typeid(T), format_tools::type_name<T>(), {{}, std::string(GroupName.view())}};
    }
    static ErasedValue erase(GroupMember<T, GroupName> &&v) { return std::move(v.value); }
};

template <typename R> struct ProvidedType
{
    static_assert(always_false_v<R>, "constructors must return std::shared_ptr<T>, a std::tuple of outputs, "
                                     "or either of them wrapped in Fallible");
};

// A single output takes the ProvideOptions given at registration.
template <typename T> struct ProvidedType<std::shared_ptr<T>>
{
    static constexpr bool fallible = false;
    static constexpr bool multiple = false;

    static std::vector<Output> outputs(ProvideOptions options)
    {
        return {OutputTraits<std::shared_ptr<T>>::describe(std::move(options))};
    }
    static std::vector<ErasedValue> erase(std::shared_ptr<T> &&v)
    {
        return {OutputTraits<std::shared_ptr<T>>::erase(std::move(v))};
    }
};

// Several outputs each carry their own name or group.
template <typename... O> struct ProvidedType<std::tuple<O...>>
{
    static_assert(sizeof...(O) > 0, "a constructor must produce at least one value");
    static constexpr bool fallible = false;
    static constexpr bool multiple = true;

    static std::vector<Output> outputs(ProvideOptions) { return {OutputTraits<O>::describe({})...}; }
    static std::vector<ErasedValue> erase(std::tuple<O...> &&values)
    {
        return std::apply([](O &...v) { return std::vector<ErasedValue>{OutputTraits<O>::erase(std::move(v))...}; },
                          values);
    }
};

template <typename T> struct ProvidedType<Fallible<T>> : ProvidedType<T>
{
    static constexpr bool fallible = true;
};

template <typename A> struct ArgTraits
{
    static_assert(always_false_v<A>, "parameters must be std::shared_ptr<T>, Named<T, \"name\">, Group<T, \"group\"> "
                                     "or Optional<...> of the first two");
};

template <typename> inline constexpr bool is_group_v = false;
template <typename T, FixedString GroupName> inline constexpr bool is_group_v<Group<T, GroupName>> = true;

template <typename T> struct ArgTraits<std::shared_ptr<T>>
{
    static Dependency describe() { return {typeid(T), format_tools::type_name<T>(), {}, {}}; }
    static Fallible<std::shared_ptr<T>> resolve(Container &c) { return c.resolve<T>(); }
};

template <typename T, FixedString Name> struct ArgTraits<Named<T, Name>>
{
    static Dependency describe() { return {typeid(T), format_tools::type_name<T>(), std::string(Name.view()), {}}; }
    static Fallible<Named<T, Name>> resolve(Container &c)
    {
        auto r = c.resolve<T>(Name.view());
        if (r.is_error())
        {
            return Fallible<Named<T, Name>>::error(r.error());
        }
        return Fallible<Named<T, Name>>::ok(Named<T, Name>{std::move(r).content()});
    }
};

template <typename T, FixedString GroupName> struct ArgTraits<Group<T, GroupName>>
{
    static Dependency describe()
    {
        return {typeid(T), format_tools::type_name<T>(), {}, std::string(GroupName.view())};
    }
    static Fallible<Group<T, GroupName>> resolve(Container &c)
    {
        auto r = c.resolve_group<T>(GroupName.view());
        if (r.is_error())
        {
            return Fallible<Group<T, GroupName>>::error(r.error());
        }
        return Fallible<Group<T, GroupName>>::ok(Group<T, GroupName>{std::move(r).content()});
    }
};

template <typename T> struct ArgTraits<Optional<T>>
{
    static_assert(!is_group_v<T>, "groups are never missing; request Group<T, \"group\"> directly");

    static Dependency describe()
    {
        Dependency dep = ArgTraits<std::shared_ptr<T>>::describe();
        dep.optional = true;
        return dep;
    }
    static Fallible<Optional<T>> resolve(Container &c)
    {
        if (!c.has_provider(describe()))
        {
            return Fallible<Optional<T>>::ok(Optional<T>{});
        }
        auto r = c.resolve<T>();
        if (r.is_error())
        {
            return Fallible<Optional<T>>::error(r.error());
        }
        return Fallible<Optional<T>>::ok(Optional<T>{std::move(r).content()});
    }
};

template <typename T, FixedString Name> struct ArgTraits<Optional<Named<T, Name>>>
{
    static Dependency describe()
    {
        Dependency dep = ArgTraits<Named<T, Name>>::describe();
        dep.optional = true;
        return dep;
    }
    static Fallible<Optional<Named<T, Name>>> resolve(Container &c)
    {
        if (!c.has_provider(describe()))
        {
            return Fallible<Optional<Named<T, Name>>>::ok(Optional<Named<T, Name>>{});
        }
        auto r = c.resolve<T>(Name.view());
        if (r.is_error())
        {
            return Fallible<Optional<Named<T, Name>>>::error(r.error());
        }
        return Fallible<Optional<Named<T, Name>>>::ok(Optional<Named<T, Name>>{std::move(r).content()});
    }
};

template <typename A> bool resolve_into(Container &c, std::optional<A> &slot, Error &err)
{
    auto r = ArgTraits<A>::resolve(c);
    if (r.is_error())
    {
        err = r.error();
        return false;
    }
    slot.emplace(std::move(r).content());
    return true;
}

// Parameter list of a constructor or invocation.
template <typename... A> struct ArgPack
{
    static std::vector<Dependency> describe() { return {ArgTraits<A>::describe()...}; }

    /// Resolves every parameter, then calls `body(args...)`. Stops at the first failure.
    template <typename Body> static Error with_args(Container &c, Body &&body)
    {
        std::tuple<std::optional<A>...> slots;
        Error err;
        const bool resolved = [&]<std::size_t... I>(std::index_sequence<I...>)
        { return (resolve_into<A>(c, std::get<I>(slots), err) && ...); }(std::index_sequence_for<A...>{});
        if (!resolved)
        {
            return err;
        }
        return std::apply([&](auto &...opt) { return body(std::move(*opt)...); }, slots);
    }
};

template <typename F> struct CallableTraits : CallableTraits<decltype(&F::operator())>
{
};
template <typename R, typename... A> struct CallableTraits<R (*)(A...)>
{
    using result = R;
    using args = ArgPack<std::remove_cvref_t<A>...>;
};
template <typename R, typename... A> struct CallableTraits<R(A...)> : CallableTraits<R (*)(A...)>
{
};
template <typename C, typename R, typename... A> struct CallableTraits<R (C::*)(A...) const> : CallableTraits<R (*)(A...)>
{
};
template <typename C, typename R, typename... A> struct CallableTraits<R (C::*)(A...)> : CallableTraits<R (*)(A...)>
{
};
template <typename R, typename... A> struct CallableTraits<R (*)(A...) noexcept> : CallableTraits<R (*)(A...)>
{
};
template <typename C, typename R, typename... A>
struct CallableTraits<R (C::*)(A...) const noexcept> : CallableTraits<R (*)(A...)>
{
};
template <typename C, typename R, typename... A>
struct CallableTraits<R (C::*)(A...) noexcept> : CallableTraits<R (*)(A...)>
{
};

LIFTOFF_UTILS_EXPORT Error constructor_failed(const std::string &type_name, const std::string &label, Error cause);
LIFTOFF_UTILS_EXPORT Error invocation_threw(const std::string &label, const std::string &what);

} // namespace detail

template <typename T> Fallible<std::shared_ptr<T>> Container::resolve(std::string_view name)
{
    auto r = resolve_erased(Dependency{typeid(T), format_tools::type_name<T>(), std::string(name), {}});
    if (r.is_error())
    {
        return Fallible<std::shared_ptr<T>>::error(r.error());
    }
    return Fallible<std::shared_ptr<T>>::ok(std::static_pointer_cast<T>(std::move(r).content()));
}

template <typename T> Fallible<std::vector<std::shared_ptr<T>>> Container::resolve_group(std::string_view group)
{
    auto r = resolve_group_erased(Dependency{typeid(T), format_tools::type_name<T>(), {}, std::string(group)});
    if (r.is_error())
    {
        return Fallible<std::vector<std::shared_ptr<T>>>::error(r.error());
    }
    std::vector<std::shared_ptr<T>> out;
    for (auto &value : r.content())
    {
        out.push_back(std::static_pointer_cast<T>(value));
    }
    return Fallible<std::vector<std::shared_ptr<T>>>::ok(std::move(out));
}

/**
 * @brief Wraps a constructor into a Provider.
 * @param options Optional name or group annotation. Only valid for a single
 *        output; a tuple of outputs names each element through its type.
 * @param loc Registration site, used as the provider's label.
 */
template <typename F>
Provider provide(F fn, ProvideOptions options = {}, std::source_location loc = std::source_location::current())
{
    using Traits = detail::CallableTraits<std::decay_t<F>>;
    using R = std::remove_cvref_t<typename Traits::result>;
    using Produced = detail::ProvidedType<R>;
    using Args = typename Traits::args;

    const std::string label = SRCLOC_TO_STR(loc);
    std::string invalid_reason;
    if (Produced::multiple && (!options.name.empty() || !options.group.empty()))
    {
        invalid_reason = "a constructor with several outputs cannot take a name or group annotation";
    }

    Provider provider{Produced::outputs(std::move(options)), Args::describe(), {}, label, std::move(invalid_reason)};
    const std::string produced_name = describe(provider.outputs);
    provider.factory = [fn = std::move(fn), produced_name,
                        label](Container &c) mutable -> Fallible<std::vector<ErasedValue>>
    {
        std::vector<ErasedValue> out;
        Error err = Args::with_args(c,
                                    [&](auto &&...args) -> Error
                                    {
                                        try
                                        {
                                            if constexpr (Produced::fallible)
                                            {
                                                auto r = fn(std::forward<decltype(args)>(args)...);
                                                if (r.is_error())
                                                {
                                                    return detail::constructor_failed(produced_name, label, r.error());
                                                }
                                                out = Produced::erase(std::move(r).content());
                                            }
                                            else
                                            {
                                                out = Produced::erase(fn(std::forward<decltype(args)>(args)...));
                                            }
                                        }
                                        catch (const std::exception &e)
                                        {
                                            return detail::constructor_failed(produced_name, label,
                                                                              Error::failure(e.what()));
                                        }
                                        if (std::any_of(out.begin(), out.end(), [](const ErasedValue &v) { return !v; }))
                                        {
                                            return detail::constructor_failed(
                                                produced_name, label, Error::failure("constructor returned null"));
                                        }
                                        return {};
                                    });
        if (err.is_error())
        {
            return Fallible<std::vector<ErasedValue>>::error(std::move(err));
        }
        return Fallible<std::vector<ErasedValue>>::ok(std::move(out));
    };
    return provider;
}

/// Registers an already-built instance.
template <typename T>
Provider supply(std::shared_ptr<T> value, ProvideOptions options = {},
                std::source_location loc = std::source_location::current())
{
    return provide([value = std::move(value)]() { return value; }, std::move(options), loc);
}

/**
 * @brief Wraps a function to be called once its parameters are resolved.
 * @details The function returns `void` or `Error`; a thrown exception becomes a failure.
 */
template <typename F> Invocation invoke(F fn, std::source_location loc = std::source_location::current())
{
    using Traits = detail::CallableTraits<std::decay_t<F>>;
    using R = typename Traits::result;
    using Args = typename Traits::args;
    static_assert(std::is_void_v<R> || std::is_same_v<std::remove_cvref_t<R>, Error>,
                  "invoked functions must return void or liftoff::Error");

    const std::string label = SRCLOC_TO_STR(loc);
    Invocation invocation{Args::describe(), {}, label};
    invocation.fn = [fn = std::move(fn), label](Container &c) mutable -> Error
    {
        return Args::with_args(c,
                               [&](auto &&...args) -> Error
                               {
                                   try
                                   {
                                       if constexpr (std::is_void_v<R>)
                                       {
                                           fn(std::forward<decltype(args)>(args)...);
                                           return {};
                                       }
                                       else
                                       {
                                           return fn(std::forward<decltype(args)>(args)...);
                                       }
                                   }
                                   catch (const std::exception &e)
                                   {
                                       return detail::invocation_threw(label, e.what());
                                   }
                               });
    };
    return invocation;
}

/**
 * @brief Invocation that stores the resolved instance of T into `target`.
 * @warning `target` must outlive the orchestrator construction.
 */
template <typename T>
Invocation populate(std::shared_ptr<T> &target, std::string name = {},
                    std::source_location loc = std::source_location::current())
{
    Invocation invocation{{Dependency{typeid(T), format_tools::type_name<T>(), name, {}}}, {}, SRCLOC_TO_STR(loc)};
    invocation.fn = [&target, name = std::move(name)](Container &c) -> Error
    {
        auto r = c.resolve<T>(name);
        if (r.is_error())
        {
            return r.error();
        }
        target = std::move(r).content();
        return {};
    };
    return invocation;
}

} // namespace liftoff::di

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
