/*
Tributary library, example 1

Scatter-gather over a thread pool. A root context is created for an incoming order; three
routes process it concurrently, each in a child context of its own, and one of them fans out
further. The root responds as soon as its own processing is done, but only reports completion
once every route, and everything the routes started, has finished.
*/

#include <tributary/tributary.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

std::mutex g_console_mutex;

void say(const std::string& line)
{
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cout << line << std::endl;
}


class Print_handler : public tributary::Exception_handler
{
public:
    tributary::Deferred_signal handle(std::exception_ptr error, tributary::Event_context& context) override
    {
        say("[handler] " + context.id() + " failed: " + tributary::describe_exception(error));
        return tributary::make_resolved_signal();
    }
};


class Orders_flow : public tributary::Flow
{
public:
    const std::string& name() const override { return m_name; }
    tributary::Exception_handler_ptr exception_handler() const override { return m_handler; }
    bool statistics_enabled() const override { return true; }

private:
    std::string                         m_name = "orders";
    tributary::Exception_handler_ptr    m_handler = std::make_shared<Print_handler>();
};


void watch(tributary::Event_context& context)
{
    const std::string id = context.id();
    context.response().subscribe([id](const tributary::Response& r) {
        say("[" + id + "] response (" + (r.failed() ? "error" : "success") + ")");
    });
    context.completion().subscribe([id](const tributary::completion_t&) {
        say("[" + id + "] completed");
    });
}

} // namespace

int main()
{
    using namespace tributary;

    auto flow = std::make_shared<const Orders_flow>();
    auto root = Event_context::create(flow, make_location("orders", "orders/http-listener"),
                                      "order-1009");
    watch(*root);

    std::vector<std::thread> routes;
    for (int i = 0; i < 3; ++i) {
        auto route = root->create_child(make_location("orders", "orders/route/" + std::to_string(i)));
        watch(*route);

        routes.emplace_back([route, i] {
            if (i == 1) {
                // this route fans out once more, and finishes before its own work does
                auto audit = route->create_child(make_location("orders", "orders/route/1/audit"));
                watch(*audit);
                std::thread audit_worker([audit] {
                    std::this_thread::sleep_for(std::chrono::milliseconds(120));
                    audit->success();
                });
                route->success();
                audit_worker.join();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(30 * (i + 1)));
            if (i == 2) {
                route->error(std::make_exception_ptr(std::runtime_error("inventory unavailable")));
            }
            else {
                route->success();
            }
        });
    }

    root->success();
    say("[main] root responded, waiting for completion");

    root->completion().wait();
    for (auto& th : routes) {
        th.join();
    }

    const auto time = root->processing_time();
    std::cout << "[main] " << *root << "\n"
              << "[main] " << time->branch_count() << " branches, "
              << std::chrono::duration_cast<std::chrono::microseconds>(time->total()).count()
              << " us of processing in flow '" << time->flow_name() << "'" << std::endl;
    return 0;
}
