#pragma once

namespace worldfetch {

// Owning file descriptor. Close() reports the close(2) result so writers can
// surface deferred write errors.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;
    int Release();

    void Reset(int fd);
    int Close();

  private:
    int fd_{-1};
};

} // namespace worldfetch
