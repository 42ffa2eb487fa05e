#include "GraceTimer.hpp"
#include "TestHeaders.hpp"

using namespace tcode;

TEST_CASE("Timer fires once after its duration", "[GraceTimer]") {
  atomic<int> fired(0);
  GraceTimer timer(chrono::milliseconds(20), [&fired] { fired++; });
  REQUIRE(timer.isPending());
  REQUIRE(timer.getDuration() == chrono::milliseconds(20));

  for (int a = 0; a < 200 && fired == 0; a++) {
    std::this_thread::sleep_for(chrono::milliseconds(10));
  }
  REQUIRE(fired.load() == 1);
  REQUIRE(timer.hasFired());

  timer.expireNow();
  timer.cancel();
  REQUIRE(fired.load() == 1);
  REQUIRE(timer.hasFired());
}

TEST_CASE("Canceled timer never fires", "[GraceTimer]") {
  atomic<int> fired(0);
  {
    GraceTimer timer(chrono::milliseconds(50), [&fired] { fired++; });
    timer.cancel();
    REQUIRE_FALSE(timer.isPending());
    REQUIRE_FALSE(timer.hasFired());
    std::this_thread::sleep_for(chrono::milliseconds(100));
  }
  REQUIRE(fired.load() == 0);
}

TEST_CASE("Destroying a pending timer fires it", "[GraceTimer]") {
  atomic<int> fired(0);
  {
    GraceTimer timer(chrono::hours(1), [&fired] { fired++; });
    REQUIRE(timer.isPending());
  }
  REQUIRE(fired.load() == 1);
}

TEST_CASE("expireNow fires early exactly once", "[GraceTimer]") {
  atomic<int> fired(0);
  GraceTimer timer(chrono::hours(1), [&fired] { fired++; });
  timer.expireNow();
  REQUIRE(fired.load() == 1);
  timer.expireNow();
  REQUIRE(fired.load() == 1);
}
