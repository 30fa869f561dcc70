#pragma once
#include <fstream>
#include <string>
#include "event_bus.hpp"

namespace cscan {
class JsonlStore : public EventSink {
   public:
    explicit JsonlStore(const std::string& path);
    ~JsonlStore() override;
    bool is_open() const {
        return is_open_;
    }
    void on_event(const ResultEvent& ev) override;

   private:
    bool is_open_{false};
    std::ofstream out_;
    void write_json(const ResultEvent& ev);
};
}  // namespace cscan
