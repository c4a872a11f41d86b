#include "kvm_frame_hub.hpp"

#include <boost/asio/post.hpp>

#include <vector>

namespace kvm
{

Subscription::Subscription(FrameHub& hub,
                           const boost::asio::any_io_executor& ex) :
    hub(&hub), executor(ex), timer(ex), lastSeq(0), closed(false)
{}

Subscription::~Subscription()
{
    if (!closed && hub)
    {
        hub->detach(this);
    }
}

std::shared_ptr<const Frame> Subscription::poll()
{
    if (closed || !hub)
    {
        return nullptr;
    }

    auto frame = hub->newerThan(lastSeq);

    if (frame)
    {
        lastSeq = frame->sequence;
    }

    return frame;
}

void Subscription::asyncWait(Handler handler)
{
    if (closed || !hub || hub->isShutdown())
    {
        boost::asio::post(executor, [handler = std::move(handler)]() {
            handler(nullptr);
        });
        return;
    }

    auto frame = poll();

    if (frame)
    {
        boost::asio::post(executor,
                          [handler = std::move(handler), frame]() {
                              handler(frame);
                          });
        return;
    }

    waitOnTimer(std::move(handler));
}

void Subscription::waitOnTimer(Handler handler)
{
    timer.expires_at(boost::asio::steady_timer::time_point::max());
    timer.async_wait([self = shared_from_this(), handler = std::move(handler)](
                         const boost::system::error_code&) mutable {
        if (self->closed || !self->hub || self->hub->isShutdown())
        {
            handler(nullptr);
            return;
        }

        auto frame = self->poll();

        if (frame)
        {
            handler(frame);
            return;
        }

        // woken without anything new, e.g. a notify raced with a poll
        self->waitOnTimer(std::move(handler));
    });
}

void Subscription::close()
{
    if (closed)
    {
        return;
    }

    closed = true;
    timer.cancel();
    if (hub)
    {
        hub->detach(this);
    }
}

void Subscription::notify()
{
    std::weak_ptr<Subscription> weak = weak_from_this();

    boost::asio::post(executor, [weak]() {
        if (auto self = weak.lock())
        {
            self->timer.cancel();
        }
    });
}

FrameHub::FrameHub(Geometry initial) :
    currentGeometry(initial), sequence(0), stopped(false)
{}

FrameHub::~FrameHub()
{
    // subscriptions may still be owned by handlers queued on an io_context
    for (const auto& weak : subscribers)
    {
        if (auto sub = weak.lock())
        {
            sub->hub = nullptr;
        }
    }
}

uint64_t FrameHub::publish(Frame&& f)
{
    std::vector<std::shared_ptr<Subscription>> wake;
    uint64_t seq;

    {
        std::lock_guard<std::mutex> lk(lock);

        f.sequence = ++sequence;
        seq = f.sequence;
        currentGeometry = f.geometry();
        frame = std::make_shared<const Frame>(std::move(f));

        for (auto it = subscribers.begin(); it != subscribers.end();)
        {
            if (auto sub = it->lock())
            {
                wake.push_back(std::move(sub));
                ++it;
            }
            else
            {
                it = subscribers.erase(it);
            }
        }
    }

    for (auto& sub : wake)
    {
        sub->notify();
    }

    return seq;
}

std::shared_ptr<const Frame> FrameHub::current() const
{
    std::lock_guard<std::mutex> lk(lock);

    return frame;
}

Geometry FrameHub::geometry() const
{
    std::lock_guard<std::mutex> lk(lock);

    return currentGeometry;
}

std::shared_ptr<Subscription>
    FrameHub::subscribe(const boost::asio::any_io_executor& ex)
{
    auto sub = std::make_shared<Subscription>(*this, ex);
    std::lock_guard<std::mutex> lk(lock);

    subscribers.push_back(sub);

    return sub;
}

size_t FrameHub::subscriberCount() const
{
    std::lock_guard<std::mutex> lk(lock);
    size_t count = 0;

    for (const auto& sub : subscribers)
    {
        if (!sub.expired())
        {
            count++;
        }
    }

    return count;
}

void FrameHub::shutdown()
{
    std::vector<std::shared_ptr<Subscription>> wake;

    {
        std::lock_guard<std::mutex> lk(lock);

        stopped = true;

        for (const auto& weak : subscribers)
        {
            if (auto sub = weak.lock())
            {
                wake.push_back(std::move(sub));
            }
        }
    }

    for (auto& sub : wake)
    {
        sub->notify();
    }
}

void FrameHub::detach(Subscription* sub)
{
    // released after the lock; a last reference dropped here detaches again
    std::vector<std::shared_ptr<Subscription>> released;
    std::lock_guard<std::mutex> lk(lock);

    subscribers.remove_if(
        [sub, &released](const std::weak_ptr<Subscription>& weak) {
            auto locked = weak.lock();
            bool gone = !locked || locked.get() == sub;

            released.push_back(std::move(locked));
            return gone;
        });
}

std::shared_ptr<const Frame> FrameHub::newerThan(uint64_t seq) const
{
    std::lock_guard<std::mutex> lk(lock);

    if (frame && frame->sequence > seq)
    {
        return frame;
    }

    return nullptr;
}

} // namespace kvm
