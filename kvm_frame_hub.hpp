#pragma once

#include "kvm_frame.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <functional>
#include <list>
#include <memory>
#include <mutex>

namespace kvm
{

class FrameHub;

/*
 * @class Subscription
 * @brief Per-session cursor into the FrameHub. Only ever hands out frames
 *        newer than the last one it handed out; intermediate frames are
 *        skipped.
 */
class Subscription : public std::enable_shared_from_this<Subscription>
{
  public:
    using Handler = std::function<void(std::shared_ptr<const Frame>)>;

    Subscription(FrameHub& hub, const boost::asio::any_io_executor& ex);
    ~Subscription();
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&&) = delete;
    Subscription& operator=(Subscription&&) = delete;

    /*
     * @brief Takes the current frame if it is newer than the last one taken
     *
     * @return The newest frame, or nullptr if there is nothing new
     */
    std::shared_ptr<const Frame> poll();

    /*
     * @brief Waits for a frame newer than the last one taken. Must be called
     *        from the subscription's executor, one wait at a time.
     *
     * @param[in] handler - Called with the frame, or with nullptr once the
     *                      subscription or the hub has been closed
     */
    void asyncWait(Handler handler);

    /* @brief Detaches from the hub and aborts a pending wait */
    void close();

    /* @brief Sequence number of the last frame taken, 0 if none */
    inline uint64_t lastSequence() const
    {
        return lastSeq;
    }

  private:
    friend class FrameHub;

    /* @brief Wakes a pending wait; called by the hub from any thread */
    void notify();

    void waitOnTimer(Handler handler);

    /* @brief Null once the hub is gone */
    FrameHub* hub;
    boost::asio::any_io_executor executor;
    /* @brief Used as an asynchronous condition variable */
    boost::asio::steady_timer timer;
    uint64_t lastSeq;
    bool closed;
};

/*
 * @class FrameHub
 * @brief Single producer, many consumer holder of the latest frame. Publishing
 *        replaces the current frame and never waits for subscribers.
 */
class FrameHub
{
  public:
    /*
     * @brief Constructs FrameHub object
     *
     * @param[in] initial - Geometry announced before the first frame arrives
     */
    explicit FrameHub(Geometry initial);
    ~FrameHub();
    FrameHub(const FrameHub&) = delete;
    FrameHub& operator=(const FrameHub&) = delete;
    FrameHub(FrameHub&&) = delete;
    FrameHub& operator=(FrameHub&&) = delete;

    /*
     * @brief Makes a frame current and wakes every subscriber
     *
     * @param[in] frame - Captured frame; its sequence number is overwritten
     *
     * @return Sequence number assigned to the frame
     */
    uint64_t publish(Frame&& frame);

    /* @brief Current frame, nullptr before the first publication */
    std::shared_ptr<const Frame> current() const;

    /* @brief Geometry of the current frame, or the initial geometry */
    Geometry geometry() const;

    /*
     * @brief Creates a subscription whose waits complete on the executor
     *
     * @param[in] ex - Executor of the session that owns the subscription
     */
    std::shared_ptr<Subscription>
        subscribe(const boost::asio::any_io_executor& ex);

    /* @brief Number of open subscriptions */
    size_t subscriberCount() const;

    /* @brief Aborts every pending wait; no new frame is handed out after */
    void shutdown();

    inline bool isShutdown() const
    {
        std::lock_guard<std::mutex> lk(lock);
        return stopped;
    }

  private:
    friend class Subscription;

    void detach(Subscription* sub);

    /*
     * @brief Returns the current frame if its sequence is above seq
     */
    std::shared_ptr<const Frame> newerThan(uint64_t seq) const;

    mutable std::mutex lock;
    std::shared_ptr<const Frame> frame;
    Geometry currentGeometry;
    uint64_t sequence;
    bool stopped;
    std::list<std::weak_ptr<Subscription>> subscribers;
};

} // namespace kvm
