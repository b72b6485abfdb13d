#ifndef DOCBOX_SLIDES_H_
#define DOCBOX_SLIDES_H_

#include <string>
#include <vector>

struct Slide {
  std::string title;
  std::string body;
  std::vector<std::string> bullets;
};

// A 16:9 slide deck. AddSlide throws std::length_error past the size cap.
class Presentation {
 public:
  Presentation() : total_bytes_(0) {}

  void AddSlide(Slide slide);
  size_t slide_count() const { return slides_.size(); }
  const std::vector<Slide>& slides() const { return slides_; }

  // PresentationML package
  std::string ToPptx() const;
  // one 720x405pt page per slide
  std::string ToPdf() const;

 private:
  std::vector<Slide> slides_;
  size_t total_bytes_;
};

#endif  // DOCBOX_SLIDES_H_
