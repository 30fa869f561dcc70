#pragma once
#include <ostream>
#include "event_bus.hpp"

namespace cscan {
// Prints one line per result: "<host> <family>/<probe> <grade> <output|error> (<ms> ms)".
class ConsoleSink : public EventSink {
   public:
    explicit ConsoleSink(std::ostream& out) : out_(out) {}
    void on_event(const ResultEvent& ev) override;

   private:
    std::ostream& out_;
};
}  // namespace cscan
