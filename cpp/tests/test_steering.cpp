// ═════════════════════════════════════════════════════════════
// Category 2: STEERING RULES
// ═════════════════════════════════════════════════════════════

static NeighborSummary averaged(float x, float y, float vx, float vy) {
  NeighborSummary s;
  s.avg_x = x;
  s.avg_y = y;
  s.avg_vx = vx;
  s.avg_vy = vy;
  s.count = 1;
  return s;
}

TEST_CASE("Cat2: Cohesion pulls toward center and folds in matching") {
  FlockConfig cfg;
  Position p = {0.0f, 0.0f};
  Velocity v = {1.0f, 0.0f};
  NeighborSummary s = averaged(100.0f, -100.0f, 3.0f, 2.0f);

  murmur::apply_cohesion(p, v, s, cfg);

  // 1 + 100*0.0005 + (3-1)*0.15
  CHECK(v.vx == doctest::Approx(1.35f));
  // 0 - 100*0.0005 + (2-0)*0.15
  CHECK(v.vy == doctest::Approx(0.25f));
}

TEST_CASE("Cat2: Alignment matches against the updated velocity") {
  FlockConfig cfg;
  Velocity v = {1.35f, 0.25f};
  NeighborSummary s = averaged(0.0f, 0.0f, 3.0f, 2.0f);

  murmur::apply_alignment(v, s, cfg);

  CHECK(v.vx == doctest::Approx(1.35f + (3.0f - 1.35f) * 0.15f));
  CHECK(v.vy == doctest::Approx(0.25f + (2.0f - 0.25f) * 0.15f));
}

TEST_CASE("Cat2: Matching term compounds across cohesion + alignment") {
  FlockConfig cfg;
  cfg.centering_factor = 0.0f;
  Position p = {0.0f, 0.0f};
  Velocity v = {0.0f, 0.0f};
  NeighborSummary s = averaged(0.0f, 0.0f, 10.0f, 0.0f);

  murmur::apply_cohesion(p, v, s, cfg);
  murmur::apply_alignment(v, s, cfg);

  // 1 - (1 - 0.15)^2 of the gap is closed, not 0.15
  CHECK(v.vx == doctest::Approx(10.0f * (1.0f - 0.85f * 0.85f)));
}

TEST_CASE("Cat2: Avoidance scales the raw close offset") {
  FlockConfig cfg;
  Velocity v = {0.0f, 0.0f};
  NeighborSummary s;
  s.close_dx = -6.0f;
  s.close_dy = 4.0f;

  murmur::apply_avoidance(v, s, cfg);

  CHECK(v.vx == doctest::Approx(-0.6f));
  CHECK(v.vy == doctest::Approx(0.4f));
}

TEST_CASE("Cat2: Edge turning") {
  FlockConfig cfg;
  ArenaBounds arena = {1000.0f, 800.0f}; // half 500 x 400

  SUBCASE("Away from every edge: untouched") {
    Velocity v = {2.0f, 3.0f};
    murmur::turn_if_edge({0.0f, 0.0f}, v, arena, cfg);
    CHECK(v.vx == 2.0f);
    CHECK(v.vy == 3.0f);
  }

  SUBCASE("Left margin is inclusive") {
    Velocity v = {0.0f, 0.0f};
    murmur::turn_if_edge({-300.0f, 0.0f}, v, arena, cfg);
    CHECK(v.vx == doctest::Approx(1.0f));
    CHECK(v.vy == 0.0f);
  }

  SUBCASE("Right and top at once") {
    Velocity v = {0.0f, 0.0f};
    murmur::turn_if_edge({450.0f, 250.0f}, v, arena, cfg);
    CHECK(v.vx == doctest::Approx(-1.0f));
    CHECK(v.vy == doctest::Approx(-1.0f));
  }

  SUBCASE("Bottom-left corner") {
    Velocity v = {0.0f, 0.0f};
    murmur::turn_if_edge({-499.0f, -399.0f}, v, arena, cfg);
    CHECK(v.vx == doctest::Approx(1.0f));
    CHECK(v.vy == doctest::Approx(1.0f));
  }

  SUBCASE("Arena narrower than two margins: low edge wins") {
    ArenaBounds tiny = {300.0f, 300.0f};
    Velocity v = {0.0f, 0.0f};
    murmur::turn_if_edge({0.0f, 0.0f}, v, tiny, cfg);
    CHECK(v.vx == doctest::Approx(1.0f));
    CHECK(v.vy == doctest::Approx(1.0f));
  }
}

TEST_CASE("Cat2: Role bias") {
  FlockConfig cfg; // bias 0.05

  SUBCASE("Scout group 1 drifts right") {
    Velocity v = {-2.0f, 1.0f};
    murmur::apply_role_bias(v, {ROLE_SCOUT, 1}, cfg);
    CHECK(v.vx == doctest::Approx(0.95f * -2.0f + 0.05f));
    CHECK(v.vy == 1.0f);
  }

  SUBCASE("Scout group 2 drifts left") {
    Velocity v = {-2.0f, 1.0f};
    murmur::apply_role_bias(v, {ROLE_SCOUT, 2}, cfg);
    CHECK(v.vx == doctest::Approx(0.95f * -2.0f - 0.05f));
  }

  SUBCASE("Common and unknown scout groups are untouched") {
    Velocity common = {-2.0f, 1.0f};
    Velocity stray = {-2.0f, 1.0f};
    murmur::apply_role_bias(common, {ROLE_COMMON, 0}, cfg);
    murmur::apply_role_bias(stray, {ROLE_SCOUT, 7}, cfg);
    CHECK(common.vx == -2.0f);
    CHECK(stray.vx == -2.0f);
  }
}
