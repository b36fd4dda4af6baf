#include <chrono>

#include "WakeRelay.hpp"

int main(int argc, char** argv)
{
    WakeRelay wakerelayd(argc, argv, std::chrono::milliseconds(20));
    return wakerelayd.run();
}
