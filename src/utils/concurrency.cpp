#include "ds/concurrency.hpp"

#include <thread>
#include <vector>

namespace ds {

struct WorkerPool::Impl {
    Impl(int n, DomainQueue& queue, Handler handler, Cancellation* cancel)
        : q(queue), handle(std::move(handler)), cancel(cancel)
    {
        if (n <= 0) n = 1;
        workers.reserve(n);
        try {
            for (int i = 0; i < n; ++i)
            {
                workers.emplace_back([this]{ this->worker_loop(); });
            }
        } catch (...) {
            // never leave a partially started pool behind
            q.close();
            join_all();
            throw;
        }
    }

    ~Impl()
    {
        q.close();
        join_all();
    }

    void join_all()
    {
        for (auto& th : workers) if (th.joinable()) th.join();
    }

    int size() const { return static_cast<int>(workers.size()); }

    std::exception_ptr first_exception() const
    {
        std::lock_guard<std::mutex> lk(mtx);
        return first_ex;
    }

    void set_first_exception(std::exception_ptr ep)
    {
        if (!ep) return;
        std::lock_guard<std::mutex> lk(mtx);
        if (!first_ex) first_ex = std::move(ep);
    }

private:
    bool cancelled() const { return cancel && cancel->is_cancelled(); }

    void worker_loop()
    {
        for(;;)
        {
            if (cancelled())
            {
                q.close();
                return;
            }
            std::optional<std::string> item = q.pop();
            if (!item) return;
            if (cancelled())
            {
                q.close();
                return;
            }
            try {
                handle(std::move(*item));
            } catch (...) {
                // keep draining; the failure surfaces from join()
                set_first_exception(std::current_exception());
            }
        }
    }

public:
    DomainQueue& q;

private:
    Handler handle;
    Cancellation* cancel;
    mutable std::mutex mtx;
    std::vector<std::thread> workers;
    std::exception_ptr first_ex;
};

WorkerPool::WorkerPool(int threads, DomainQueue& queue, Handler handler, Cancellation* cancel)
  : impl_(new Impl(threads, queue, std::move(handler), cancel))
{}

WorkerPool::~WorkerPool()
{
    delete impl_;
}

void WorkerPool::join()
{
    impl_->join_all();
    if (auto ep = impl_->first_exception()) std::rethrow_exception(ep);
}

int WorkerPool::size() const
{
    return impl_->size();
}

} // namespace ds
