#include <iostream>
#include <heb.hpp>

// executes inside the current environment
void run() {
    // pipeline requests to the native runtime, 4 at a time
    auto squares = [](size_t count) {
        return heb::ordered_requests(count, [](size_t i) {
            return heb::native::local_runtime::request([i]{ return i * i; });
        }, 4);
    };

    heb::unified_iterator<size_t> it(squares(10));

    for(size_t sq : it) {
        std::cout << "square: " << sq << std::endl;
    }

    // process results as they complete, stopping early
    heb::unified_iterator<size_t> it2(squares(100));

    auto done = it2.run_as_completed([](heb::future<size_t> f) {
        size_t sq = f.result();
        std::cout << "processed: " << sq << std::endl;
        return sq < 50;
    });

    done.result();
    std::cout << "done" << std::endl;
}

int main() {
    std::cout << "initializing..." << std::endl;
    auto lf = heb::initialize();

    heb::policy p(heb::environment_store::make(heb::environment_store::thread));
    auto reg = p.registration();
    auto env = p.new_environment();

    {
        auto scope = env.use();
        run();
    }

    env.dispose();
    return 0;
}
