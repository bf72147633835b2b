#pragma once
#include <functional>
#include <initializer_list>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

// Runs a handler on its own thread when one of the given signals arrives.
// The handler fires at most once. Destruction stops the thread, so a watcher
// can never outlive the objects its handler touches when it is declared after
// them.
class SignalWatcher
{
public:
    using Handler = std::function<void(int)>;

    SignalWatcher(std::initializer_list<int> signals, Handler handler);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    boost::asio::io_context ioc_{1};
    boost::asio::signal_set signals_;
    Handler handler_;
    std::thread thread_;
};
