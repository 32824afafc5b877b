#include <shardrt/core/group.hpp>

#include <algorithm>

#include <shardrt/support/env.hpp>
#include <shardrt/support/logging.hpp>

namespace shardrt::core {

namespace {

std::optional<std::size_t> worker_threads_from_env()
{
    try {
        return support::env_positive_size(support::worker_threads_env);
    } catch (const std::invalid_argument& ex) {
        throw plan_error(plan_errc::invalid_config, ex.what());
    }
}

} // namespace

group_driver::group_driver(group_config config)
    : config_(std::move(config))
{}

group_driver::~group_driver() = default;

support::topology group_driver::resolve_topology() const
{
    if (config_.topology) {
        return *config_.topology;
    }

    if (config_.numa_enabled()) {
        try {
            return config_.discover ? config_.discover() : support::discover_topology();
        } catch (const support::topology_error& ex) {
            support::logger()->error("numa-aware group requested but topology discovery failed: {}", ex.what());
            std::throw_with_nested(group_error(group_errc::numa_unavailable,
                                               std::string{"numa unavailable: "} + ex.what()));
        }
    }

    // Node boundaries are irrelevant without numa awareness.
    return support::single_node_topology(support::allowed_cores());
}

const std::vector<plan_entry>& group_driver::prepare()
{
    if (prepared_) {
        return plan_;
    }

    auto log = support::logger();

    topology_ = resolve_topology().without(config_.reserved_cores);
    log->debug("topology: {}", topology_.to_string());

    plan_options options;
    options.mode = config_.mode;
    options.workers_per_numa = config_.workers_per_numa;
    options.shard_count = config_.shard_count;

    try {
        env_worker_threads_ = worker_threads_from_env();
        plan_ = make_plan(topology_, options);
    } catch (const plan_error& ex) {
        log->error("cannot plan {} group: {}", to_string(config_.mode), ex.what());
        std::throw_with_nested(group_error(group_errc::plan, std::string{"shard plan failed: "} + ex.what()));
    }

    log->info("planned {} shard(s), affinity {}", plan_.size(), to_string(config_.mode));
    for (const auto& entry : plan_) {
        log->info("  {}", to_string(entry));
    }

    run_init();
    prepared_ = true;
    return plan_;
}

void group_driver::run_init()
{
    if (!config_.init) {
        return;
    }

    auto log = support::logger();
    const auto start = support::clock::now();
    try {
        runtime_options options;
        options.name = "shardrt-init";
        options.worker_threads = init_worker_threads;
        init_runtime_ = std::make_unique<runtime>(std::move(options));

        runtime& rt = *init_runtime_;
        auto result = rt.spawn([this, &rt] { return config_.init(rt); });
        init_value_ = std::make_shared<const init_value>(result.get());
    } catch (...) {
        log->error("init workload failed: {}", describe(std::current_exception()));
        init_runtime_.reset();
        std::throw_with_nested(group_error(group_errc::init, "init workload failed"));
    }
    log->debug("init workload finished in {:.2f} ms", support::elapsed_ms(start));
}

std::size_t group_driver::worker_threads_for(const plan_entry& entry) const
{
    if (config_.worker_threads) {
        return *config_.worker_threads;
    }
    if (env_worker_threads_) {
        return *env_worker_threads_;
    }
    if (!entry.bound_cores.empty()) {
        return entry.bound_cores.size();
    }
    // Unbound shards split the machine between them.
    return std::max<std::size_t>(1, support::allowed_cores().size() / std::max<std::size_t>(1, plan_.size()));
}

std::vector<group_driver::report> group_driver::launch(const shard::body_type& body)
{
    if (!prepared_) {
        throw std::logic_error("group_driver::launch called before prepare");
    }

    auto log = support::logger();
    const auto start = support::clock::now();

    auto binder = config_.binder ? config_.binder : support::make_os_binder();
    auto factory = config_.runtime_factory ? config_.runtime_factory
                                           : std::make_shared<default_runtime_factory>();

    std::vector<std::unique_ptr<shard>> shards;
    shards.reserve(plan_.size());
    for (const auto& entry : plan_) {
        shard_environment env;
        env.binder = binder;
        env.factory = factory;
        env.worker_threads = worker_threads_for(entry);
        env.shard_count = plan_.size();
        env.init = init_value_;
        shards.push_back(std::make_unique<shard>(entry, std::move(env)));
    }

    for (auto& s : shards) {
        s->start(body);
    }
    for (auto& s : shards) {
        s->join();
    }

    std::vector<report> reports;
    reports.reserve(shards.size());
    std::size_t failed = 0;
    for (auto& s : shards) {
        report r;
        r.placement = s->entry();
        r.error = s->error();
        if (r.error) ++failed;
        reports.push_back(std::move(r));
    }

    // Background work started by init may run until every shard is done.
    init_runtime_.reset();
    init_value_.reset();

    log->info("group finished: {} shard(s), {} failed, {:.2f} ms",
              reports.size(), failed, support::elapsed_ms(start));
    return reports;
}

group_builder& group_builder::numa(bool enable) noexcept
{
    config_.mode = enable ? affinity_mode::numa_aware : affinity_mode::core_only;
    return *this;
}

group_builder& group_builder::workers_per_numa(std::size_t n)
{
    if (n == 0) {
        throw std::invalid_argument("workers_per_numa must be at least 1");
    }
    config_.workers_per_numa = n;
    return *this;
}

group_builder& group_builder::affinity(affinity_mode mode) noexcept
{
    config_.mode = mode;
    return *this;
}

group_builder& group_builder::shards(std::size_t n)
{
    if (n == 0) {
        throw std::invalid_argument("shard count must be at least 1");
    }
    config_.shard_count = n;
    return *this;
}

group_builder& group_builder::worker_threads(std::size_t n)
{
    if (n == 0) {
        throw std::invalid_argument("worker_threads must be at least 1");
    }
    config_.worker_threads = n;
    return *this;
}

group_builder& group_builder::reserve_cores(core_set cores)
{
    config_.reserved_cores = support::make_core_set(std::move(cores));
    return *this;
}

group_builder& group_builder::topology(support::topology topo)
{
    config_.topology = std::move(topo);
    return *this;
}

group_builder& group_builder::discover(std::function<support::topology()> fn)
{
    config_.discover = std::move(fn);
    return *this;
}

group_builder& group_builder::binder(std::shared_ptr<support::affinity_binder> binder)
{
    config_.binder = std::move(binder);
    return *this;
}

group_builder& group_builder::runtime_factory(std::shared_ptr<core::runtime_factory> factory)
{
    config_.runtime_factory = std::move(factory);
    return *this;
}

} // namespace shardrt::core
