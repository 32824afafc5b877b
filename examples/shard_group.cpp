#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <string>
#include <vector>

#include <sched.h>

#include <shardrt/core/group.hpp>

// Usage: shard_group [numa|cores|none] [workers_per_numa]
//
// Starts one shard group on this machine and prints where each shard ran.

namespace {

struct placement_report {
    int         cpu;
    std::size_t tasks;
};

void print_nested(const std::exception& ex, int depth = 0)
{
    std::cerr << std::string(static_cast<std::size_t>(depth) * 2, ' ') << ex.what() << '\n';
    try {
        std::rethrow_if_nested(ex);
    } catch (const std::exception& inner) {
        print_nested(inner, depth + 1);
    }
}

} // namespace

int main(int argc, char** argv)
{
    const std::string mode = argc > 1 ? argv[1] : "cores";
    const std::size_t per_node = argc > 2 ? static_cast<std::size_t>(std::strtoul(argv[2], nullptr, 10)) : 1;

    try {
        shardrt::core::group_builder builder;
        if (mode == "numa") {
            builder.numa(true).workers_per_numa(per_node);
        } else if (mode == "none") {
            builder.affinity(shardrt::core::affinity_mode::none);
        } else if (mode != "cores") {
            std::cerr << "unknown mode '" << mode << "'\n";
            return 2;
        }

        auto outcomes = builder
                            .init([] { return std::string{"hello from init"}; })
                            .entry([](shardrt::core::shard_context& ctx) {
                                constexpr std::size_t kTasks = 32;
                                std::vector<std::future<int>> cpus;
                                for (std::size_t i = 0; i < kTasks; ++i) {
                                    cpus.push_back(ctx.spawn([] { return ::sched_getcpu(); }));
                                }
                                for (auto& f : cpus) f.get();
                                (void)ctx.init_result<std::string>();
                                return placement_report{::sched_getcpu(), kTasks};
                            })
                            .run();

        int failed = 0;
        for (const auto& o : outcomes) {
            if (o.ok()) {
                std::cout << "shard " << o.shard_index() << ": cpu " << o.value().cpu
                          << ", " << o.value().tasks << " tasks\n";
            } else {
                std::cout << "shard " << o.shard_index() << ": " << o.error().message() << '\n';
                ++failed;
            }
        }
        return failed == 0 ? 0 : 1;
    } catch (const shardrt::core::group_error& ex) {
        std::cerr << "shard_group: group did not start\n";
        print_nested(ex, 1);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "shard_group exception: " << ex.what() << '\n';
        return 1;
    }
}
