#include "sc/gl/CompositePass.hpp"

#include <cstdio>
#include <string>

namespace sc {

static const char* kCompositeComp = R"GLSL(
layout(local_size_x = SC_WORKGROUP_SIZE, local_size_y = SC_WORKGROUP_SIZE) in;

layout(std140, binding = 0) uniform CanvasUniform {
    mat3 u_transform;
    mat3 u_invTransform;
    uvec2 u_canvasSize;
    uvec2 u_tileCount;
    uint u_tileSize;
};

layout(std430, binding = 1) readonly buffer TileMapper {
    uint u_mapping[];
};

layout(binding = 0) uniform sampler2DArray u_pile;
layout(rgba16f, binding = 0) writeonly uniform image2D u_output;

const uint NO_TILE = 0xFFFFFFFFu;

void main() {
    ivec2 px = ivec2(gl_GlobalInvocationID.xy);
    ivec2 size = imageSize(u_output);
    if (px.x >= size.x || px.y >= size.y) return;

    vec2 canvasPos = (u_invTransform * vec3(vec2(px) + 0.5, 1.0)).xy;
    if (canvasPos.x < 0.0 || canvasPos.y < 0.0 ||
        canvasPos.x >= float(u_canvasSize.x) || canvasPos.y >= float(u_canvasSize.y)) {
        return;
    }

    uvec2 tile = uvec2(canvasPos) / u_tileSize;
    if (tile.x >= u_tileCount.x || tile.y >= u_tileCount.y) return;

    // Tiles of other groups are written by their own dispatch.
    uint layer = u_mapping[tile.y * u_tileCount.x + tile.x];
    if (layer == NO_TILE) return;

    // Partial edge tiles hold stale texels past the canvas; keep the filter
    // footprint inside the written region.
    uvec2 origin = tile * u_tileSize;
    vec2 valid = vec2(min(uvec2(u_tileSize), u_canvasSize - origin));
    vec2 local = clamp(canvasPos - vec2(origin), vec2(0.5), valid - 0.5);
    vec2 inTile = local / float(u_tileSize);
    imageStore(u_output, px, textureLod(u_pile, vec3(inTile, float(layer)), 0.0));
}
)GLSL";

static void packMat3(const Mat3& m, float out[12]) {
  for (int col = 0; col < 3; col++) {
    out[col * 4 + 0] = m.m[col * 3 + 0];
    out[col * 4 + 1] = m.m[col * 3 + 1];
    out[col * 4 + 2] = m.m[col * 3 + 2];
    out[col * 4 + 3] = 0.0f;
  }
}

CompositePass::CompositePass(const EngineConfig& cfg) : cfg_(cfg) {}

CompositePass::~CompositePass() {
  releaseSurface();
  if (clearFbo_) glDeleteFramebuffers(1, &clearFbo_);
  if (sampler_) glDeleteSamplers(1, &sampler_);
  if (uniformBuffer_) glDeleteBuffers(1, &uniformBuffer_);
}

bool CompositePass::init() {
  if (inited_) return true;

  std::string src = "#version 430 core\n#define SC_WORKGROUP_SIZE " +
                    std::to_string(cfg_.workgroupSize) + "\n" + kCompositeComp;
  if (!program_.buildCompute(src.c_str())) {
    std::fprintf(stderr, "CompositePass: failed to build composite program\n");
    return false;
  }

  glGenBuffers(1, &uniformBuffer_);
  glBindBuffer(GL_UNIFORM_BUFFER, uniformBuffer_);
  glBufferData(GL_UNIFORM_BUFFER, sizeof(CanvasUniform), nullptr, GL_DYNAMIC_DRAW);
  glBindBuffer(GL_UNIFORM_BUFFER, 0);

  glGenSamplers(1, &sampler_);
  glSamplerParameteri(sampler_, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glSamplerParameteri(sampler_, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glSamplerParameteri(sampler_, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glSamplerParameteri(sampler_, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

  glGenFramebuffers(1, &clearFbo_);

  inited_ = true;
  return true;
}

void CompositePass::releaseSurface() {
  if (surface_.texture) {
    glDeleteTextures(1, &surface_.texture);
  }
  surface_ = CompositeSurface{};
}

bool CompositePass::resizeSurface(int width, int height) {
  if (surface_.texture && surface_.width == width && surface_.height == height) return true;

  releaseSurface();
  if (width <= 0 || height <= 0) return false;

  glGenTextures(1, &surface_.texture);
  glBindTexture(GL_TEXTURE_2D, surface_.texture);
  glTexStorage2D(GL_TEXTURE_2D, 1, GL_RGBA16F, width, height);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glBindTexture(GL_TEXTURE_2D, 0);

  glBindFramebuffer(GL_FRAMEBUFFER, clearFbo_);
  glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D,
                         surface_.texture, 0);
  GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
  glBindFramebuffer(GL_FRAMEBUFFER, 0);
  if (status != GL_FRAMEBUFFER_COMPLETE) {
    std::fprintf(stderr, "CompositePass: intermediate surface incomplete (0x%x)\n", status);
    releaseSurface();
    return false;
  }

  surface_.width = width;
  surface_.height = height;
  reallocations_++;
  return true;
}

void CompositePass::prepare(const URect& viewRect, const Mat3& pixelToView,
                            std::uint32_t canvasWidth, std::uint32_t canvasHeight,
                            std::uint32_t tileSize) {
  prepared_ = false;
  if (!inited_) return;
  if (!resizeSurface(static_cast<int>(viewRect.width), static_cast<int>(viewRect.height))) return;

  // Intermediate pixel (0, 0) sits at the view rect's top-left corner.
  Mat3 toSurface = Mat3::translation(-static_cast<float>(viewRect.x),
                                     -static_cast<float>(viewRect.y)) * pixelToView;

  grid_ = calcTileCount(canvasWidth, canvasHeight, tileSize);
  packMat3(toSurface, uniform_.transform);
  packMat3(toSurface.inverse(), uniform_.invTransform);
  uniform_.canvasSize[0] = canvasWidth;
  uniform_.canvasSize[1] = canvasHeight;
  uniform_.tileCount[0] = grid_.x;
  uniform_.tileCount[1] = grid_.y;
  uniform_.tileSize = tileSize;

  glBindBuffer(GL_UNIFORM_BUFFER, uniformBuffer_);
  glBufferSubData(GL_UNIFORM_BUFFER, 0, sizeof(CanvasUniform), &uniform_);
  glBindBuffer(GL_UNIFORM_BUFFER, 0);
  prepared_ = true;
}

std::vector<std::uint32_t> CompositePass::buildMapping(const GroupedView& group,
                                                       TileGridSize grid) {
  std::vector<std::uint32_t> mapping(grid.count(), kNoTile);
  for (const GroupedTile& t : group.tiles) {
    if (t.coord.x >= grid.x || t.coord.y >= grid.y) continue;
    mapping[static_cast<std::size_t>(t.coord.y) * grid.x + t.coord.x] = t.arrayLayer;
  }
  return mapping;
}

CompositeSurface CompositePass::draw(const std::vector<GroupedView>& groups, Stats& stats) {
  if (!prepared_) return CompositeSurface{};

  mappings_.reset();

  // Pixels outside the canvas are never written by a dispatch.
  glDisable(GL_SCISSOR_TEST);
  glBindFramebuffer(GL_FRAMEBUFFER, clearFbo_);
  glClearBufferfv(GL_COLOR, 0, cfg_.clearColor);
  glBindFramebuffer(GL_FRAMEBUFFER, 0);

  if (grid_.empty()) return surface_;

  program_.use();
  glBindBufferBase(GL_UNIFORM_BUFFER, 0, uniformBuffer_);
  glBindImageTexture(0, surface_.texture, 0, GL_FALSE, 0, GL_WRITE_ONLY, GL_RGBA16F);
  glActiveTexture(GL_TEXTURE0);
  glBindSampler(0, sampler_);

  const GLuint groupsX = ceilDiv(static_cast<std::uint32_t>(surface_.width), cfg_.workgroupSize);
  const GLuint groupsY = ceilDiv(static_cast<std::uint32_t>(surface_.height), cfg_.workgroupSize);

  for (const GroupedView& group : groups) {
    std::vector<std::uint32_t> mapping = buildMapping(group, grid_);
    GLuint ssbo = mappings_.upload(mapping.data(), mapping.size());

    glBindBufferBase(GL_SHADER_STORAGE_BUFFER, 1, ssbo);
    glBindTexture(GL_TEXTURE_2D_ARRAY, group.pile);
    glDispatchCompute(groupsX, groupsY, 1);

    stats.dispatches++;
    stats.groups++;
    stats.visibleTiles += static_cast<std::uint32_t>(group.tiles.size());
  }

  glMemoryBarrier(GL_TEXTURE_FETCH_BARRIER_BIT | GL_SHADER_IMAGE_ACCESS_BARRIER_BIT |
                  GL_FRAMEBUFFER_BARRIER_BIT | GL_TEXTURE_UPDATE_BARRIER_BIT);

  glBindTexture(GL_TEXTURE_2D_ARRAY, 0);
  glBindSampler(0, 0);
  glBindBufferBase(GL_SHADER_STORAGE_BUFFER, 1, 0);
  glBindBufferBase(GL_UNIFORM_BUFFER, 0, 0);
  glBindImageTexture(0, 0, 0, GL_FALSE, 0, GL_WRITE_ONLY, GL_RGBA16F);
  glUseProgram(0);

  stats.uploadedBytesThisFrame += mappings_.uploadedBytes();
  return surface_;
}

} // namespace sc
