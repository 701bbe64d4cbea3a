#pragma once

#include <memory>

namespace slideshow::scheduling { class PlaylistComposer; }

namespace slideshow::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<slideshow::scheduling::PlaylistComposer> composer;
};

}
