#include <iostream>
#include <heb.hpp>

// a request executed by the native runtime, resumed on the scheduler
heb::co<int> my_coroutine(heb::unified_future<int> request) {
    int i = co_await request;
    std::cout << "received: " << i << std::endl;
    co_return i * 2;
}

int main() {
    // start the bridge and stash RAII management object on stack
    auto lifecycle = heb::initialize(); 

    heb::policy p(heb::environment_store::make(heb::environment_store::global));
    auto reg = p.registration();
    auto env = p.new_environment();

    // drive coroutines with a scheduler installed as the loop
    auto sch = heb::scheduler::make();
    heb::set_loop(std::make_shared<heb::scheduler_loop>(sch));

    heb::unified_future<int> request;

    {
        auto scope = env.use();
        request = heb::native::local_runtime::request([]{ return 21; });
    }

    int result = sch->run_until_complete(my_coroutine(request));
    std::cout << "result: " << result << std::endl;

    heb::reset_loop();
    env.dispose();
    return 0;
}
