#ifndef __TCODE_CLIENT_CHANNEL__
#define __TCODE_CLIENT_CHANNEL__

#include "Headers.hpp"

namespace tcode {
/**
 * @brief Outbound half of one browser connection.
 */
class ClientChannel {
 public:
  virtual ~ClientChannel() {}

  /**
   * @brief Queues one text message. Safe to call from any thread; messages
   * are delivered in the order they were queued.
   */
  virtual void send(const string& payload) = 0;
  virtual bool isOpen() = 0;
};
}  // namespace tcode

#endif  // __TCODE_CLIENT_CHANNEL__
