#ifndef OBSERVER_CHANNEL_HPP
#define OBSERVER_CHANNEL_HPP

#include <string>

// A connected observer of state changes. deliver() returns false (or throws)
// when the message could not be handed over; the broadcaster then drops the
// observer.
class IObserverChannel {
public:
  virtual ~IObserverChannel() = default;
  virtual bool deliver(const std::string &message) = 0;
  virtual std::string get_description() const = 0;
};

#endif // OBSERVER_CHANNEL_HPP
