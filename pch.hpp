// pch.hpp
#pragma once

// ---------------------------------------------------------
// External libraries
// ---------------------------------------------------------
#include <nlohmann/json.hpp>
#include <SFML/Audio.hpp>
#include <portaudio.h>
#include <curl/curl.h>

// ---------------------------------------------------------
// Standard Library
// ---------------------------------------------------------
#include <iostream>
#include <vector>
#include <string>
#include <sstream>
#include <unordered_map>
#include <deque>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <thread>
#include <chrono>
#include <iomanip>
#include <optional>
#include <memory>
#include <functional>
#include <fstream>
#include <mutex>
#include <condition_variable>
#include <atomic>
