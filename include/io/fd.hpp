#pragma once

namespace fwfleet {

// Owning file descriptor. Closes on destruction unless released.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd);
    int Release();
    // Returns the close(2) result so callers writing data can detect
    // deferred write errors.
    int Close();

  private:
    int fd_{-1};
};

} // namespace fwfleet
