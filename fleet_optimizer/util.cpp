#include "util.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

using namespace std;

string make_uuid()
{
    thread_local mt19937_64 rng(random_device{}());
    uniform_int_distribution<int> nibble(0, 15);
    const char* hex = "0123456789abcdef";

    string out;
    out.reserve(36);
    for (int i = 0; i < 32; i++) {
        if (i == 8 || i == 12 || i == 16 || i == 20) out += '-';
        int v = nibble(rng);
        if (i == 12) v = 4;                 // version
        if (i == 16) v = (v & 0x3) | 0x8;   // variant 10xx
        out += hex[v];
    }
    return out;
}

string iso_timestamp()
{
    auto now = chrono::system_clock::now();
    time_t secs = chrono::system_clock::to_time_t(now);
    auto micros = chrono::duration_cast<chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    tm local{};
    localtime_r(&secs, &local);

    ostringstream os;
    os << put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.' << setw(6) << setfill('0') << micros;
    return os.str();
}
