/*
Tributary library, example 2

An inbound connector bridging an external transport. The connector creates the root context
with the message id it received, the server id of this node and an external completion link:
the transport acknowledgement. The connector answers the caller on response, but only releases
the message (and its resources) on completion, which also waits for the acknowledgement.

The error path uses an exception handler that works asynchronously, like one that forwards the
failed message to a dead letter queue.
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


class Dead_letter_handler : public tributary::Exception_handler
{
public:
    // Waits for every forwarding started so far.
    void drain()
    {
        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            workers.swap(m_workers);
        }
        for (auto& th : workers) {
            th.join();
        }
    }

    tributary::Deferred_signal handle(std::exception_ptr error, tributary::Event_context& context) override
    {
        auto signal = tributary::make_deferred_signal();
        const std::string id = context.id();
        const std::string reason = tributary::describe_exception(error);

        std::lock_guard<std::mutex> lock(m_mutex);
        m_workers.emplace_back([signal, id, reason] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            say("[dead letter] stored " + id + " (" + reason + ")");
            signal->fire(tributary::Signal_result{});
        });
        return signal;
    }

private:
    std::mutex                  m_mutex;
    std::vector<std::thread>    m_workers;
};


struct Inbound_message
{
    std::string id;
    std::string correlation_id;
    bool        poison;
};


void receive(const Inbound_message& message, const tributary::Context_config& config,
             const tributary::Exception_handler_ptr& handler)
{
    auto acknowledged = tributary::make_deferred_signal();

    auto context = tributary::Event_context::create(
        message.id,
        std::string(),
        tributary::make_location("connector", "connector/inbound"),
        message.correlation_id,
        acknowledged,
        handler,
        config);

    context->response().subscribe([&message](const tributary::Response& r) {
        say("[connector] " + message.id + ": replying " + (r.failed() ? "500" : "200"));
    });

    context->add_executed_processor("connector/inbound");
    if (message.poison) {
        auto done = context->error(std::make_exception_ptr(std::invalid_argument("malformed payload")));
        done->wait().rethrow_if_failed();
    }
    else {
        context->add_executed_processor("connector/transform");
        context->success();
    }

    // the transport acknowledges after the reply went out
    say("[connector] " + message.id + ": acknowledging");
    acknowledged->fire(tributary::Signal_result{});

    context->completion().wait();
    std::cout << "[connector] released " << *context << " on server " << context->server_id()
              << ", trace of " << context->processors_trace().size() << " processors" << std::endl;
}

} // namespace

int main()
{
    auto config = tributary::Context_config::from_environment();
    auto handler = std::make_shared<Dead_letter_handler>();

    int result = 0;
    try {
        receive({"msg-1", "corr-a", false}, config, handler);
        receive({"msg-2", "", true}, config, handler);
    }
    catch (const tributary::handler_failure& e) {
        std::cerr << e.what() << std::endl;
        result = 1;
    }
    handler->drain();
    return result;
}
