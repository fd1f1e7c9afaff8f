/**
 * @file container.cpp
 * @brief Provider registry, lazy construction with cycle detection, and DOT rendering.
 */
#include "lft_base.hpp"
#include "utils/container.hpp"

#include <map>
#include <set>

namespace liftoff::di
{

namespace
{
using SlotKey = std::pair<std::type_index, std::string>;

// One output of one provider.
struct OutputRef
{
    std::size_t provider;
    std::size_t output;
};

// DOT string literal. Backslashes pass through so "\n" stays a DOT line break.
std::string quote(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s)
    {
        if (c == '"')
        {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}
} // namespace

std::string describe(const Dependency &dep)
{
    if (dep.is_group())
    {
        return fmt::format("[]{}[group={}]", dep.type_name, dep.group);
    }
    if (!dep.name.empty())
    {
        return fmt::format("{}[name={}]", dep.type_name, dep.name);
    }
    return dep.type_name;
}

std::string describe(const Output &output)
{
    if (!output.options.group.empty())
    {
        return fmt::format("{}[group={}]", output.type_name, output.options.group);
    }
    if (!output.options.name.empty())
    {
        return fmt::format("{}[name={}]", output.type_name, output.options.name);
    }
    return output.type_name;
}

std::string describe(const std::vector<Output> &outputs)
{
    std::string out;
    for (const auto &output : outputs)
    {
        if (!out.empty())
        {
            out += ", ";
        }
        out += describe(output);
    }
    return out;
}

namespace detail
{
Error constructor_failed(const std::string &type_name, const std::string &label, Error cause)
{
    return Error::wrap(ErrorKind::ConstructorFailed,
                       fmt::format("constructor of {} registered at {} failed", type_name, label), std::move(cause));
}

Error invocation_threw(const std::string &label, const std::string &what)
{
    return Error::failuref("invoke {} threw: {}", label, what);
}
} // namespace detail

struct Container::Impl
{
    std::vector<Provider> providers;
    std::vector<std::vector<ErasedValue>> values; // parallel to providers; empty until built
    std::map<SlotKey, OutputRef> singles;
    std::map<SlotKey, std::vector<OutputRef>> groups;

    std::vector<OutputRef> constructing; // outputs currently being built, outermost first
    std::vector<std::string> requesters; // who is asking, for error messages
    std::set<std::string> failed_nodes;
    std::set<std::string> missing_nodes;

    [[nodiscard]] std::string node_id(OutputRef ref) const
    {
        const Output &out = providers[ref.provider].outputs[ref.output];
        if (!out.options.group.empty())
        {
            // Group members are not unique by key; the provider index tells them apart.
            if (providers[ref.provider].outputs.size() == 1)
            {
                return fmt::format("{}[group={}]#{}", out.type_name, out.options.group, ref.provider);
            }
            return fmt::format("{}[group={}]#{}.{}", out.type_name, out.options.group, ref.provider, ref.output);
        }
        return describe(out);
    }

    [[nodiscard]] std::string current_requester() const
    {
        return requesters.empty() ? std::string("<direct resolve>") : requesters.back();
    }

    Fallible<ErasedValue> construct(OutputRef ref, Container &self)
    {
        if (!values[ref.provider].empty())
        {
            return Fallible<ErasedValue>::ok(values[ref.provider][ref.output]);
        }

        auto in_progress = std::find_if(constructing.begin(), constructing.end(),
                                        [&ref](const OutputRef &o) { return o.provider == ref.provider; });
        if (in_progress != constructing.end())
        {
            std::string path;
            for (auto it = in_progress; it != constructing.end(); ++it)
            {
                failed_nodes.insert(node_id(*it));
                path += node_id(*it) + " -> ";
            }
            path += node_id(ref);
            return Fallible<ErasedValue>::error(
                Error::make(ErrorKind::DependencyCycle, fmt::format("dependency cycle detected: {}", path)));
        }

        const Provider &provider = providers[ref.provider];
        constructing.push_back(ref);
        requesters.push_back(fmt::format("constructor of {} registered at {}", node_id(ref), provider.label));
        auto pop = basics::make_scope_guard(
            [this]
            {
                constructing.pop_back();
                requesters.pop_back();
            });

        const std::size_t failed_before = failed_nodes.size();
        LFT_DEBUG("container: constructing {}", describe(provider.outputs));
        auto result = provider.factory(self);
        if (result.is_error())
        {
            // Attribute the failure here unless a deeper node already owns it.
            if (failed_nodes.size() == failed_before)
            {
                failed_nodes.insert(node_id(ref));
            }
            return Fallible<ErasedValue>::error(result.error());
        }
        auto built = std::move(result).content();
        if (built.size() != provider.outputs.size())
        {
            failed_nodes.insert(node_id(ref));
            return Fallible<ErasedValue>::error(detail::constructor_failed(
                describe(provider.outputs), provider.label,
                Error::failuref("produced {} values for {} outputs", built.size(), provider.outputs.size())));
        }
        values[ref.provider] = std::move(built);
        return Fallible<ErasedValue>::ok(values[ref.provider][ref.output]);
    }
};

Container::Container() : pImpl(std::make_unique<Impl>()) {}
Container::~Container() = default;

Error Container::provide(Provider provider)
{
    const std::string produced = describe(provider.outputs);
    if (!provider.invalid_reason.empty())
    {
        return Error::make(ErrorKind::InvalidProvider,
                           fmt::format("cannot provide {} from {}: {}", produced, provider.label,
                                       provider.invalid_reason));
    }
    if (!provider.factory || provider.outputs.empty())
    {
        return Error::make(ErrorKind::InvalidProvider,
                           fmt::format("cannot provide {}: no constructor given at {}", produced, provider.label));
    }

    // Validate every output before registering any of them.
    std::set<SlotKey> own_keys;
    for (const auto &output : provider.outputs)
    {
        if (!output.options.name.empty() && !output.options.group.empty())
        {
            return Error::make(ErrorKind::InvalidProvider,
                               fmt::format("cannot provide {} from {}: may not specify both name and group",
                                           output.type_name, provider.label));
        }
        if (!output.options.group.empty())
        {
            continue;
        }
        const SlotKey key{output.type, output.options.name};
        auto existing = pImpl->singles.find(key);
        if (existing != pImpl->singles.end())
        {
            return Error::make(ErrorKind::InvalidProvider,
                               fmt::format("cannot provide {} from {}: already provided by {}",
                                           pImpl->node_id(existing->second), provider.label,
                                           pImpl->providers[existing->second.provider].label));
        }
        if (!own_keys.insert(key).second)
        {
            return Error::make(ErrorKind::InvalidProvider,
                               fmt::format("cannot provide {} from {}: produced twice by the same constructor",
                                           describe(output), provider.label));
        }
    }

    const std::size_t index = pImpl->providers.size();
    for (std::size_t i = 0; i < provider.outputs.size(); ++i)
    {
        const Output &output = provider.outputs[i];
        if (!output.options.group.empty())
        {
            pImpl->groups[SlotKey{output.type, output.options.group}].push_back(OutputRef{index, i});
        }
        else
        {
            pImpl->singles.emplace(SlotKey{output.type, output.options.name}, OutputRef{index, i});
        }
    }
    pImpl->providers.push_back(std::move(provider));
    pImpl->values.emplace_back();
    return {};
}

Error Container::invoke(const Invocation &invocation)
{
    if (!invocation.fn)
    {
        return Error::failuref("invoke {}: nothing to call", invocation.label);
    }
    pImpl->requesters.push_back(fmt::format("invoke {}", invocation.label));
    auto pop = basics::make_scope_guard([this] { pImpl->requesters.pop_back(); });
    return invocation.fn(*this);
}

bool Container::has_provider(const Dependency &dep) const
{
    if (dep.is_group())
    {
        return pImpl->groups.count(SlotKey{dep.type, dep.group}) != 0;
    }
    return pImpl->singles.count(SlotKey{dep.type, dep.name}) != 0;
}

Fallible<ErasedValue> Container::resolve_erased(const Dependency &dep)
{
    if (dep.is_group())
    {
        return Fallible<ErasedValue>::error(
            Error::failuref("{} is a value group; resolve it with resolve_group", describe(dep)));
    }
    auto it = pImpl->singles.find(SlotKey{dep.type, dep.name});
    if (it == pImpl->singles.end())
    {
        const std::string id = describe(dep);
        pImpl->missing_nodes.insert(id);
        pImpl->failed_nodes.insert(id);
        return Fallible<ErasedValue>::error(
            Error::make(ErrorKind::MissingDependency,
                        fmt::format("missing dependency: no provider of {} (required by {})", id,
                                    pImpl->current_requester())));
    }
    return pImpl->construct(it->second, *this);
}

Fallible<std::vector<ErasedValue>> Container::resolve_group_erased(const Dependency &dep)
{
    std::vector<ErasedValue> out;
    auto it = pImpl->groups.find(SlotKey{dep.type, dep.group});
    if (it == pImpl->groups.end())
    {
        // An empty group is not an error.
        return Fallible<std::vector<ErasedValue>>::ok(std::move(out));
    }
    for (const OutputRef &ref : it->second)
    {
        auto value = pImpl->construct(ref, *this);
        if (value.is_error())
        {
            return Fallible<std::vector<ErasedValue>>::error(value.error());
        }
        out.push_back(std::move(value).content());
    }
    return Fallible<std::vector<ErasedValue>>::ok(std::move(out));
}

bool Container::can_visualize(const Error &err) const noexcept
{
    return err.contains(ErrorKind::MissingDependency) || err.contains(ErrorKind::DependencyCycle) ||
           err.contains(ErrorKind::ConstructorFailed);
}

std::string Container::visualize(const Error &err) const
{
    const bool highlight = can_visualize(err);
    const auto &impl = *pImpl;

    fmt::memory_buffer out;
    auto line = [&out](std::string_view text) { fmt::format_to(std::back_inserter(out), "\t{}\n", text); };

    fmt::format_to(std::back_inserter(out), "digraph {{\n");
    line("rankdir=RL;");
    line("graph [compound=true];");

    for (std::size_t i = 0; i < impl.providers.size(); ++i)
    {
        const auto &outputs = impl.providers[i].outputs;
        // Values produced by one constructor share a cluster.
        const bool clustered = outputs.size() > 1;
        if (clustered)
        {
            line(fmt::format("subgraph cluster_{} {{", i));
            line(fmt::format("label={};", quote(impl.providers[i].label)));
        }
        for (std::size_t o = 0; o < outputs.size(); ++o)
        {
            const std::string id = impl.node_id(OutputRef{i, o});
            const bool failed = highlight && impl.failed_nodes.count(id) != 0;
            line(fmt::format("{} [shape=box label={}{}];", quote(id), quote(id + "\\n" + impl.providers[i].label),
                             failed ? " color=red" : ""));
        }
        if (clustered)
        {
            line("}");
        }
    }

    for (const auto &[key, members] : impl.groups)
    {
        const Output &first = impl.providers[members.front().provider].outputs[members.front().output];
        const std::string group_id = describe(Dependency{key.first, first.type_name, {}, key.second});
        line(fmt::format("{} [shape=diamond];", quote(group_id)));
        for (const OutputRef &member : members)
        {
            line(fmt::format("{} -> {} [style=dashed];", quote(impl.node_id(member)), quote(group_id)));
        }
    }

    if (highlight)
    {
        for (const auto &id : impl.missing_nodes)
        {
            line(fmt::format("{} [style=dashed color=red];", quote(id)));
        }
    }

    for (std::size_t i = 0; i < impl.providers.size(); ++i)
    {
        for (std::size_t o = 0; o < impl.providers[i].outputs.size(); ++o)
        {
            const std::string id = impl.node_id(OutputRef{i, o});
            for (const auto &dep : impl.providers[i].dependencies)
            {
                line(fmt::format("{} -> {}{};", quote(id), quote(describe(dep)), dep.optional ? " [style=dotted]" : ""));
            }
        }
    }

    fmt::format_to(std::back_inserter(out), "}}\n");
    return fmt::to_string(out);
}

std::size_t Container::provider_count() const noexcept
{
    return pImpl->providers.size();
}

} // namespace liftoff::di
