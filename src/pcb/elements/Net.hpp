#pragma once

#include <string>
#include <utility>

class Net
{
public:
    Net(int id_val, std::string net_name) : id_(id_val), name_(std::move(net_name)) {}

    [[nodiscard]] int GetId() const { return id_; }
    [[nodiscard]] const std::string& GetName() const { return name_; }

private:
    int id_ = -1;
    std::string name_;
};
