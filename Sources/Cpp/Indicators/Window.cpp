// 표준 라이브러리
#include <algorithm>
#include <cmath>

// 파일 헤더
#include "Indicators/Window.hpp"

// 내부 헤더
#include "Engines/Exception.hpp"

// 네임 스페이스
namespace rolling_stdev {
using namespace exception;
}  // namespace rolling_stdev

namespace rolling_stdev::indicator {

void Window::CompensatedSum::Add(const long double term) {
  const long double total = sum + term;

  // 큰 쪽을 기준으로 잃어버린 하위 비트를 복원
  if (fabs(sum) >= fabs(term)) {
    compensation += (sum - total) + term;
  } else {
    compensation += (term - total) + sum;
  }

  sum = total;
}

long double Window::CompensatedSum::Value() const { return sum + compensation; }

Window::Window(const size_t capacity)
    : capacity_(capacity),
      buffer_(capacity, 0.0),
      head_(0),
      count_(0),
      anchor_(0.0L),
      anchor_index_(0),
      equal_run_(0) {
  if (capacity_ == 0) {
    throw InvalidValue("윈도우 크기는 1 이상이어야 합니다.");
  }
}

Window Window::Restore(const size_t capacity, const vector<double>& values) {
  if (values.size() > capacity) {
    throw InvalidValue("복원할 값의 개수 " + to_string(values.size()) +
                       "이(가) 윈도우 크기 " + to_string(capacity) +
                       "을(를) 초과합니다.");
  }

  Window window(capacity);
  for (const double value : values) {
    window.Push(value);
  }

  return window;
}

void Window::Push(const double value) {
  // 원형 버퍼의 다음 쓰기 위치
  const size_t tail = (head_ + count_) % capacity_;
  bool anchor_evicted = false;

  if (count_ == capacity_) {
    // 윈도우 이동: 가장 오래된 값 제거
    const long double old = buffer_[head_] - anchor_;
    deviation_sum_.Add(-old);
    deviation_sum_sq_.Add(-(old * old));

    anchor_evicted = head_ == anchor_index_;
    head_ = (head_ + 1) % capacity_;
    count_--;
  }

  if (count_ == 0) {
    anchor_ = value;
    anchor_index_ = tail;
    deviation_sum_ = {};
    deviation_sum_sq_ = {};
  }

  // 연속 동일 값 개수 갱신
  if (count_ > 0 && buffer_[(head_ + count_ - 1) % capacity_] == value) {
    equal_run_ = min(equal_run_ + 1, count_ + 1);
  } else {
    equal_run_ = 1;
  }

  buffer_[tail] = value;
  count_++;

  const long double deviation = value - anchor_;
  deviation_sum_.Add(deviation);
  deviation_sum_sq_.Add(deviation * deviation);

  // 기준 값은 capacity_번 추가마다 한 번 제거되므로 분할 상환 O(1)
  if (anchor_evicted) {
    Rebase(tail);
  }
}

optional<double> Window::Stdev() const {
  if (count_ == 0) {
    return nullopt;
  }

  // 모든 값이 동일하면 부동 소수점 오차 없이 0
  if (equal_run_ >= count_) {
    return 0.0;
  }

  const auto n = static_cast<long double>(count_);
  const long double mean_deviation = deviation_sum_.Value() / n;

  // 상쇄 오차로 인한 음수 분산 보정
  const long double var =
      max(0.0L, deviation_sum_sq_.Value() / n - mean_deviation * mean_deviation);

  return static_cast<double>(sqrt(var));
}

void Window::Reset() {
  ranges::fill(buffer_, 0.0);
  head_ = 0;
  count_ = 0;
  anchor_ = 0.0L;
  anchor_index_ = 0;
  deviation_sum_ = {};
  deviation_sum_sq_ = {};
  equal_run_ = 0;
}

vector<double> Window::GetValues() const {
  vector<double> values;
  values.reserve(count_);

  for (size_t i = 0; i < count_; i++) {
    values.push_back(buffer_[(head_ + i) % capacity_]);
  }

  return values;
}

size_t Window::GetCount() const { return count_; }
size_t Window::GetCapacity() const { return capacity_; }
bool Window::IsEmpty() const { return count_ == 0; }

double Window::GetSum() const {
  long double sum = 0.0L;
  for (size_t i = 0; i < count_; i++) {
    sum += buffer_[(head_ + i) % capacity_];
  }

  return static_cast<double>(sum);
}

double Window::GetSumSq() const {
  long double sum_sq = 0.0L;
  for (size_t i = 0; i < count_; i++) {
    const long double value = buffer_[(head_ + i) % capacity_];
    sum_sq += value * value;
  }

  return static_cast<double>(sum_sq);
}

void Window::Rebase(const size_t newest_index) {
  anchor_ = buffer_[newest_index];
  anchor_index_ = newest_index;
  deviation_sum_ = {};
  deviation_sum_sq_ = {};

  for (size_t i = 0; i < count_; i++) {
    const long double deviation = buffer_[(head_ + i) % capacity_] - anchor_;
    deviation_sum_.Add(deviation);
    deviation_sum_sq_.Add(deviation * deviation);
  }
}

}  // namespace rolling_stdev::indicator
