#ifndef THREAD_HPP
#define THREAD_HPP

#include <atomic>
#include <exception>
#include <functional>
#include <thread>
#include <vector>

// Runs 'fn' on 'num_threads' threads and waits until they all finish.
// 'fn' should pull work from a shared queue until it runs dry or until
// 'stop' becomes true.
// The first exception thrown by any thread is rethrown here after joining.
template<typename Fn>
void parallelize(unsigned const num_threads, Fn const& fn)
{
    std::atomic<bool> stop = false;

    if(num_threads <= 1)
    {
        fn(stop);
        return;
    }

    std::vector<std::exception_ptr> exception_ptrs(num_threads, nullptr);
    std::vector<std::thread> threads;
    threads.reserve(num_threads);

    for(unsigned i = 0; i < num_threads; ++i)
    {
        threads.emplace_back([&fn, &stop](std::exception_ptr& exception_ptr)
        {
            try
            {
                fn(stop);
            }
            catch(...)
            {
                exception_ptr = std::current_exception();
                stop = true;
            }
        }, std::ref(exception_ptrs[i]));
    }

    for(std::thread& thread : threads)
        thread.join();

    for(std::exception_ptr const& ptr : exception_ptrs)
        if(ptr)
            std::rethrow_exception(ptr);
}

#endif
