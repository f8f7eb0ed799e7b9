#include <islr/model/parameter_store.hpp>

namespace islr::model {

std::size_t ParameterStore::add(std::string name, cv::Mat value) {
  tensors_.push_back({std::move(name), std::move(value)});
  return tensors_.size() - 1;
}

std::size_t ParameterStore::find(std::string_view name) const noexcept {
  for (std::size_t i = 0; i < tensors_.size(); ++i) {
    if (tensors_[i].name == name) return i;
  }
  return tensors_.size();
}

ParameterStore ParameterStore::zeros_like() const {
  ParameterStore out;
  for (const auto& t : tensors_) {
    out.add(t.name, cv::Mat::zeros(t.value.size(), t.value.type()));
  }
  return out;
}

void ParameterStore::set_zero() {
  for (auto& t : tensors_) {
    t.value.setTo(cv::Scalar::all(0));
  }
}

void ParameterStore::accumulate(const ParameterStore& other, double scale) {
  CV_Assert(other.size() == size());
  for (std::size_t i = 0; i < tensors_.size(); ++i) {
    cv::scaleAdd(other.at(i), scale, tensors_[i].value, tensors_[i].value);
  }
}

std::size_t ParameterStore::num_elements() const noexcept {
  std::size_t n = 0;
  for (const auto& t : tensors_) n += t.value.total();
  return n;
}

ParameterStore ParameterStore::clone() const {
  ParameterStore out;
  for (const auto& t : tensors_) {
    out.add(t.name, t.value.clone());
  }
  return out;
}

}  // namespace islr::model
