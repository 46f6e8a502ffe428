// tests/test_communicator.cpp
#include "tinylm/distributed/communicator.hpp"
#include "tinylm/distributed/thread_communicator.hpp"
#include "test_utils.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tinylm;
using namespace tinylm_test;

int main() {
    std::cout << "Testing communicators..." << std::endl;

    try {
        section("Test 1: world of one");
        distributed::LocalCommunicator local;
        std::vector<Eigen::MatrixXf> tensors = {Eigen::MatrixXf::Constant(2, 2, 3.0f)};
        local.all_reduce_mean(tensors);
        check(local.is_main() && local.world_size() == 1, "rank 0 of 1");
        check(tensors[0](0, 0) == 3.0f, "mean of one is itself");
        check(local.all_reduce_mean(2.5) == 2.5 && local.any(true) && !local.any(false), "scalar collectives");

        section("Test 2: thread group averages");
        const int world = 4;
        auto comms = distributed::make_thread_communicators(world);
        check(comms.size() == static_cast<size_t>(world), "one communicator per rank");

        std::vector<std::vector<Eigen::MatrixXf>> grads(world);
        std::vector<double> scalars(world);
        std::vector<int> flags(world);
        std::vector<std::thread> threads;
        for (int r = 0; r < world; ++r) {
            threads.emplace_back([&, r] {
                auto& comm = *comms[r];
                // Several rounds to exercise reuse of the barrier
                for (int round = 0; round < 3; ++round) {
                    grads[r] = {Eigen::MatrixXf::Constant(3, 2, static_cast<float>(r + round)),
                                Eigen::MatrixXf::Constant(1, 2, static_cast<float>(2 * r))};
                    comm.all_reduce_mean(grads[r]);
                    scalars[r] = comm.all_reduce_mean(static_cast<double>(r));
                    flags[r] = comm.any(r == 2 && round == 1) ? 1 : 0;
                    comm.barrier();
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        bool identical = true;
        for (int r = 0; r < world; ++r) {
            identical = identical && grads[r][0] == grads[0][0] && grads[r][1] == grads[0][1];
        }
        check(identical, "every rank holds the same result");
        check(grads[0][0](0, 0) == 1.5f + 2.0f, "mean of r + round over ranks");
        check(grads[0][1](0, 0) == 3.0f, "mean of 2r over ranks");
        check(scalars[0] == 1.5 && scalars[3] == 1.5, "scalar mean");
        check(flags[0] == 0 && flags[3] == 0, "no flag raised in the last round");

        section("Test 3: any() sees a single raised flag");
        auto pair = distributed::make_thread_communicators(2);
        std::atomic<int> raised{0};
        std::thread a([&] { raised += pair[0]->any(false) ? 1 : 0; });
        std::thread b([&] { raised += pair[1]->any(true) ? 1 : 0; });
        a.join();
        b.join();
        check(raised == 2, "both ranks see true");

        section("Test 4: abort releases waiting peers");
        auto group = distributed::make_thread_communicators(2);
        std::atomic<bool> released{false};
        std::thread waiter([&] {
            try {
                group[0]->barrier();
            } catch (const std::runtime_error&) {
                released = true;
            }
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        group[1]->abort();
        waiter.join();
        check(released, "blocked rank gets an error instead of hanging");
        check(throws<std::runtime_error>([&] { group[1]->barrier(); }), "aborted group refuses new collectives");

        check(throws<std::invalid_argument>([] { distributed::make_thread_communicators(0); }), "empty group rejected");
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return finish("test_communicator");
}
